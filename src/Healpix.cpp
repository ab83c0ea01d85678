#include "skymodel/Healpix.hpp"
#include "skymodel/Exceptions.hpp"

#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <stdexcept>
#include <string>

namespace skymodel {
namespace healpix {
namespace {

long isqrt(long v)
{
    long r = static_cast<long>(std::sqrt(static_cast<double>(v) + 0.5));
    while (r * r > v) --r;
    while ((r + 1) * (r + 1) <= v) ++r;
    return r;
}

} // unnamed namespace

bool is_valid_nside(long nside)
{
    return nside > 0 && (nside & (nside - 1)) == 0;
}

bool is_valid_npix(long npix)
{
    if (npix <= 0 || npix % 12 != 0) return false;
    const long n2 = npix / 12;
    const long nside = isqrt(n2);
    return nside * nside == n2 && is_valid_nside(nside);
}

long nside2npix(long nside)
{
    if (!is_valid_nside(nside))
        throw ResolutionError("invalid HEALPix nside " + std::to_string(nside));
    return 12 * nside * nside;
}

long npix2nside(long npix)
{
    if (!is_valid_npix(npix))
        throw ResolutionError("the number of pixels (" + std::to_string(npix)
                              + ") does not correspond to a valid HEALPix nside");
    return isqrt(npix / 12);
}

void pix2ang_ring(long nside, long pix, double& theta, double& phi)
{
    using boost::math::double_constants::pi;
    using boost::math::double_constants::half_pi;

    const long npix = nside2npix(nside);
    if (pix < 0 || pix >= npix)
        throw std::out_of_range("pixel index " + std::to_string(pix) + " out of range");

    const long   ncap  = 2 * nside * (nside - 1);
    const double fact2 = 4.0 / static_cast<double>(npix);
    double z;

    if (pix < ncap) {                                   // north polar cap
        const long iring = (1 + isqrt(1 + 2 * pix)) >> 1;
        const long iphi  = (pix + 1) - 2 * iring * (iring - 1);
        z   = 1.0 - static_cast<double>(iring * iring) * fact2;
        phi = (static_cast<double>(iphi) - 0.5) * half_pi / static_cast<double>(iring);
    }
    else if (pix < npix - ncap) {                       // equatorial belt
        const double fact1 = static_cast<double>(2 * nside) * fact2;
        const long   ip    = pix - ncap;
        const long   iring = ip / (4 * nside) + nside;
        const long   iphi  = ip % (4 * nside) + 1;
        const double fodd  = ((iring + nside) & 1) ? 1.0 : 0.5;
        z   = static_cast<double>(2 * nside - iring) * fact1;
        phi = (static_cast<double>(iphi) - fodd) * pi / static_cast<double>(2 * nside);
    }
    else {                                              // south polar cap
        const long ip    = npix - pix;
        const long iring = (1 + isqrt(2 * ip - 1)) >> 1;
        const long iphi  = 4 * iring + 1 - (ip - 2 * iring * (iring - 1));
        z   = -1.0 + static_cast<double>(iring * iring) * fact2;
        phi = (static_cast<double>(iphi) - 0.5) * half_pi / static_cast<double>(iring);
    }
    theta = std::acos(z);
}

Eigen::Vector3d pix2vec_ring(long nside, long pix)
{
    double theta = 0.0, phi = 0.0;
    pix2ang_ring(nside, pix, theta, phi);
    const double st = std::sin(theta);
    return Eigen::Vector3d(st * std::cos(phi), st * std::sin(phi), std::cos(theta));
}

} // namespace healpix
} // namespace skymodel
