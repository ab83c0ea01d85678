#include "skymodel/Component.hpp"
#include "skymodel/Broadcast.hpp"
#include "skymodel/Exceptions.hpp"

#include <sstream>
#include <stdexcept>

namespace skymodel {

Component::Component(Quantity amp, Quantity freq_ref, SpectralParameters params)
    : amp_(std::move(amp)), freq_ref_(std::move(freq_ref)), params_(std::move(params))
{
    validate_freq_ref(freq_ref_);
    freq_ref_hz_ = freq_ref_.to_value(units::Hz, spectral());
}

const Quantity& Component::parameter(const std::string& key) const
{
    auto it = params_.find(key);
    if (it == params_.end()) throw std::out_of_range(name() + ": no spectral parameter '" + key + "'");
    return it->second;
}

Array2D Component::parameter_value(const std::string& key, const Unit& unit) const
{
    const Quantity& p = parameter(key);
    if (!p.convertible_to(unit))
        throw UnitError(name() + ": spectral parameter '" + key + "' must have units compatible with '"
                        + unit.name + "' (got '" + p.unit().name + "')");
    return p.to_value(unit);
}

Quantity Component::scale_to(const Quantity& freq) const
{
    if (freq.size() != 1)
        throw ShapeError("scale_to expects a single frequency, got shape " + freq.shape_str());

    const double freq_hz = freq.to_value(units::Hz, spectral())(0, 0);
    const Array2D scaling = get_freq_scaling(freq_hz);
    return Quantity(amp_.value() * broadcast_to(scaling, amp_.rows(), amp_.cols()),
                    scaled_unit());
}

std::vector<Quantity> Component::scale_to_frequencies(const Quantity& freqs) const
{
    if (freqs.rows() != 1 && freqs.cols() != 1)
        throw ShapeError("frequencies must be (1, F) or (F, 1), got " + freqs.shape_str());

    const Array2D hz = freqs.to_value(units::Hz, spectral());
    std::vector<Quantity> out;
    out.reserve(static_cast<std::size_t>(hz.size()));
    for (Index k = 0; k < hz.size(); ++k)
        out.push_back(scale_to(Quantity(hz(k), units::Hz)));
    return out;
}

std::string Component::repr() const
{
    std::ostringstream s;
    s << name() << "(";
    bool first = true;
    for (const auto& kv : params_) {
        if (!first) s << ", ";
        s << kv.first;
        first = false;
    }
    s << ")";
    return s.str();
}

} // namespace skymodel
