#pragma once
#include "Quantity.hpp"
#include <string>

namespace skymodel {

/* Read a RING ordered HEALPix map from the first binary table extension of
 * a FITS file.  `nfields` Stokes columns are read (1 or 3; 0 reads every
 * column up to three).  Single precision columns are widened to double.
 * Throws std::runtime_error for NESTED maps.                               */
Array2D read_healpix_map(const std::string& path, int nfields = 0);

// Write a (S, npix) map as I/Q/U columns with HEALPix header keywords.
// Overwrites an existing file.
void write_healpix_map(const std::string& path, const Quantity& map);

} // namespace skymodel
