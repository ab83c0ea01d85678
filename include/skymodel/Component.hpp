#pragma once
#include "Quantity.hpp"
#include "Validation.hpp"
#include <string>
#include <vector>

namespace skymodel {

/* A sky component: an amplitude map given at a reference frequency plus
 * the spectral parameters of its SED.  Concrete components validate their
 * inputs in the constructor and implement get_freq_scaling().              */
class Component {
public:
    virtual ~Component() = default;

    virtual std::string label() const = 0;      // "synch", "dust", ...
    virtual std::string name()  const = 0;      // "Synchrotron", ...

    /* Dimensionless scaling from freq_ref to `freq_hz`.  The result
     * broadcasts against amp(): (1|S, 1|N). */
    virtual Array2D get_freq_scaling(double freq_hz) const = 0;

    // amp * scaling at one frequency; `freq` is a (1,1) frequency or wavelength
    Quantity scale_to(const Quantity& freq) const;

    // One (S, N) map per entry of a (1, F) or (F, 1) frequency quantity
    std::vector<Quantity> scale_to_frequencies(const Quantity& freqs) const;

    const Quantity&           amp()      const { return amp_; }
    const Quantity&           freq_ref() const { return freq_ref_; }
    const SpectralParameters& spectral_parameters() const { return params_; }
    const Quantity&           parameter(const std::string& key) const;

    std::string repr() const;

protected:
    Component(Quantity amp, Quantity freq_ref, SpectralParameters params);

    // Unit of scale_to() results
    virtual Unit scaled_unit() const { return amp_.unit(); }

    // freq_ref in Hz, (S, 1)
    const Array2D& freq_ref_hz() const { return freq_ref_hz_; }

    // Parameter converted to `unit`; UnitError if it cannot be
    Array2D parameter_value(const std::string& key, const Unit& unit) const;

    Quantity           amp_;
    Quantity           freq_ref_;
    SpectralParameters params_;

private:
    Array2D freq_ref_hz_;
};

} // namespace skymodel
