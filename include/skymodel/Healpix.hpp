#pragma once
#include "Types.hpp"

namespace skymodel {
namespace healpix {

// nside must be a positive power of two
bool is_valid_nside(long nside);

// npix must equal 12 * nside^2 for a valid nside
bool is_valid_npix(long npix);

long nside2npix(long nside);

// Throws ResolutionError for a pixel count that is not a HEALPix map
long npix2nside(long npix);

/* Colatitude theta and longitude phi (radians) of the centre of a RING
 * ordered pixel. */
void pix2ang_ring(long nside, long pix, double& theta, double& phi);

// Unit vector of the centre of a RING ordered pixel
Eigen::Vector3d pix2vec_ring(long nside, long pix);

} // namespace healpix
} // namespace skymodel
