#pragma once
#include "Quantity.hpp"
#include "Templates.hpp"
#include <map>
#include <string>

namespace skymodel {

using SpectralParameters = std::map<std::string, Quantity>;

/* Shape and unit checks shared by every component family.  Each function
 * returns normally or throws one of TypeError, ShapeError, ResolutionError
 * or UnitError; nothing is modified.                                        */

// (1,1) or (3,1), convertible to GHz directly or through spectral()
void validate_freq_ref(const Quantity& freq_ref);

// Diffuse maps: amp is (S, npix) with a valid HEALPix npix
void validate_diffuse(const Quantity& amp,
                      const Quantity& freq_ref,
                      const SpectralParameters& spectral_parameters);

// Point sources: amp is (S, nsources) in flux units, catalog has nsources
void validate_point_source(const Quantity& amp,
                           const Quantity& freq_ref,
                           const PointSourceCatalog& catalog,
                           const SpectralParameters& spectral_parameters);

// Line emission: amp is velocity integrated brightness
void validate_line(const Quantity& amp, const Quantity& freq_ref);

} // namespace skymodel
