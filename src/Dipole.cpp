#include "skymodel/Dipole.hpp"
#include "skymodel/Healpix.hpp"

#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace skymodel {

DipoleFit fit_dipole(const Eigen::Ref<const Eigen::ArrayXd>& map, double gal_cut_deg)
{
    const long nside = healpix::npix2nside(map.size());
    const double z_cut = std::sin(gal_cut_deg * boost::math::double_constants::degree);

    Eigen::Matrix4d normal = Eigen::Matrix4d::Zero();
    Eigen::Vector4d rhs    = Eigen::Vector4d::Zero();
    long used = 0;

    for (long p = 0; p < map.size(); ++p) {
        const Eigen::Vector3d n = healpix::pix2vec_ring(nside, p);
        if (gal_cut_deg > 0.0 && std::abs(n.z()) < z_cut) continue;
        if (!std::isfinite(map[p])) continue;

        const Eigen::Vector4d basis(1.0, n.x(), n.y(), n.z());
        normal.noalias() += basis * basis.transpose();
        rhs              += map[p] * basis;
        ++used;
    }

    if (used < 4)
        throw std::runtime_error("fit_dipole(): only " + std::to_string(used)
                                 + " unmasked pixels, cannot fit monopole + dipole");

    Eigen::FullPivLU<Eigen::Matrix4d> lu(normal);
    if (!lu.isInvertible())
        throw std::runtime_error("fit_dipole(): unmasked pixels do not constrain the dipole");

    const Eigen::Vector4d coeff = lu.solve(rhs);
    DipoleFit fit;
    fit.monopole = coeff[0];
    fit.dipole   = coeff.tail<3>();
    return fit;
}

Eigen::ArrayXd dipole_map(const DipoleFit& fit, long nside)
{
    const long npix = healpix::nside2npix(nside);
    Eigen::ArrayXd out(npix);
    for (long p = 0; p < npix; ++p)
        out[p] = fit.dipole.dot(healpix::pix2vec_ring(nside, p));
    return out;
}

} // namespace skymodel
