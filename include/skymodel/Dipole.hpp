#pragma once
#include "Types.hpp"

namespace skymodel {

struct DipoleFit {
    double          monopole = 0.0;
    Eigen::Vector3d dipole   = Eigen::Vector3d::Zero();   // amplitude * direction
};

/* Least-squares fit of monopole + dipole to a RING ordered HEALPix map.
 * Pixels with |latitude| < gal_cut_deg are left out of the fit.
 * Throws ResolutionError for a non-HEALPix map and std::runtime_error if
 * the unmasked pixels cannot constrain the fit. */
DipoleFit fit_dipole(const Eigen::Ref<const Eigen::ArrayXd>& map, double gal_cut_deg);

// Dipole pattern d . n(p) for every pixel of an nside map
Eigen::ArrayXd dipole_map(const DipoleFit& fit, long nside);

} // namespace skymodel
