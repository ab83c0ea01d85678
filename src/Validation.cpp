#include "skymodel/Validation.hpp"
#include "skymodel/Constants.hpp"
#include "skymodel/Exceptions.hpp"
#include "skymodel/Healpix.hpp"

namespace skymodel {
namespace {

void require_quantity(const Quantity& q, const std::string& what)
{
    if (q.empty())
        throw TypeError(what + " must be a non-empty quantity");
}

void require_stokes_match(const Quantity& amp, const Quantity& freq_ref,
                          const char* count_name)
{
    if (amp.rows() != freq_ref.rows())
        throw ShapeError(std::string("shape of amplitude map must be either (1, `")
                         + count_name + "`) or (3, `" + count_name + "`) depending on "
                         "if the component is polarized; got " + amp.shape_str()
                         + " with reference frequency " + freq_ref.shape_str());
}

void require_output_unit(const Quantity& amp, const Quantity& freq_ref,
                         const std::string& expected)
{
    if (!amp.convertible_to(DEFAULT_OUTPUT_UNIT, brightness_temperature(freq_ref)))
        throw UnitError("amplitude must have units compatible with " + expected
                        + " (got '" + amp.unit().name + "')");
}

enum class Family { Diffuse, PointSource };

void validate_parameters(const SpectralParameters& params, const Quantity& amp,
                         Family family)
{
    for (const auto& [name, p] : params) {
        require_quantity(p, "spectral parameter '" + name + "'");

        if (p.rows() != amp.rows())
            throw ShapeError("shape of spectral parameter '" + name + "' must be (S, 1) "
                             "or (S, N) with S = " + std::to_string(amp.rows())
                             + "; got " + p.shape_str());
        if (p.cols() <= 1) continue;

        if (family == Family::Diffuse) {
            if (!healpix::is_valid_npix(p.cols()))
                throw ResolutionError("the number of pixels (" + std::to_string(p.cols())
                                      + ") in the spectral parameter map '" + name
                                      + "' does not correspond to a valid HEALPix nside");
            if (p.cols() != amp.cols())
                throw ShapeError("spectral parameter map '" + name + "' has "
                                 + std::to_string(p.cols()) + " pixels but the amplitude map has "
                                 + std::to_string(amp.cols()));
        }
        else if (p.cols() != amp.cols()) {
            throw ShapeError("spectral parameter '" + name + "' has "
                             + std::to_string(p.cols()) + " entries but there are "
                             + std::to_string(amp.cols()) + " point sources");
        }
    }
}

} // unnamed namespace

void validate_freq_ref(const Quantity& freq_ref)
{
    require_quantity(freq_ref, "reference frequency");

    if (freq_ref.cols() != 1 || (freq_ref.rows() != 1 && freq_ref.rows() != 3))
        throw ShapeError("shape of reference frequency must be either (1, 1) or (3, 1) "
                         "depending on if the component is polarized; got "
                         + freq_ref.shape_str());

    if (!freq_ref.convertible_to(DEFAULT_FREQ_UNIT, spectral()))
        throw UnitError("reference frequency must have units compatible with "
                        + DEFAULT_FREQ_UNIT.name + " (got '" + freq_ref.unit().name + "')");
}

void validate_diffuse(const Quantity& amp,
                      const Quantity& freq_ref,
                      const SpectralParameters& spectral_parameters)
{
    validate_freq_ref(freq_ref);
    require_quantity(amp, "amplitude map");

    if (!healpix::is_valid_npix(amp.cols()))
        throw ResolutionError("the number of pixels " + amp.shape_str()
                              + " in the amplitude map does not correspond to a "
                              "valid HEALPix nside");

    require_stokes_match(amp, freq_ref, "npix");
    require_output_unit(amp, freq_ref, DEFAULT_OUTPUT_UNIT.name);
    validate_parameters(spectral_parameters, amp, Family::Diffuse);
}

void validate_point_source(const Quantity& amp,
                           const Quantity& freq_ref,
                           const PointSourceCatalog& catalog,
                           const SpectralParameters& spectral_parameters)
{
    validate_freq_ref(freq_ref);
    require_quantity(amp, "point source amplitudes");
    require_stokes_match(amp, freq_ref, "nsources");

    // Amplitudes are fluxes; per steradian they become a brightness
    require_output_unit(amp / units::sr, freq_ref, DEFAULT_OUTPUT_UNIT.name + " sr");

    if (catalog.size() != amp.cols())
        throw ShapeError("number of point sources (" + std::to_string(amp.cols())
                         + ") does not match the number of cataloged points ("
                         + std::to_string(catalog.size()) + ")");

    validate_parameters(spectral_parameters, amp, Family::PointSource);
}

void validate_line(const Quantity& amp, const Quantity& freq_ref)
{
    validate_freq_ref(freq_ref);
    require_quantity(amp, "amplitude map");
    require_stokes_match(amp, freq_ref, "npix");
    require_output_unit(amp / units::km_per_s, freq_ref,
                        DEFAULT_OUTPUT_UNIT.name + " km / s");
}

} // namespace skymodel
