// HEALPix resolution checks and RING pixel centres

#include <gtest/gtest.h>
#include <boost/math/constants/constants.hpp>
#include <cmath>

#include "skymodel/Exceptions.hpp"
#include "skymodel/Healpix.hpp"

using namespace skymodel;
using boost::math::double_constants::pi;

namespace {

TEST(HealpixTest, ValidPixelCounts) {
    EXPECT_TRUE(healpix::is_valid_npix(12));
    EXPECT_TRUE(healpix::is_valid_npix(48));
    EXPECT_TRUE(healpix::is_valid_npix(192));
    EXPECT_TRUE(healpix::is_valid_npix(12 * 1024 * 1024));

    EXPECT_FALSE(healpix::is_valid_npix(0));
    EXPECT_FALSE(healpix::is_valid_npix(13));
    EXPECT_FALSE(healpix::is_valid_npix(108));     // nside 3
    EXPECT_FALSE(healpix::is_valid_npix(-12));
}

TEST(HealpixTest, NsideRoundTrip) {
    EXPECT_EQ(healpix::nside2npix(4), 192);
    EXPECT_EQ(healpix::npix2nside(192), 4);
    EXPECT_EQ(healpix::npix2nside(12), 1);
    EXPECT_THROW(healpix::npix2nside(100), ResolutionError);
    EXPECT_THROW(healpix::nside2npix(3), ResolutionError);
}

TEST(HealpixTest, Nside1PixelCentres) {
    double theta = 0.0, phi = 0.0;

    healpix::pix2ang_ring(1, 0, theta, phi);            // north cap
    EXPECT_NEAR(theta, std::acos(2.0 / 3.0), 1e-12);
    EXPECT_NEAR(phi, pi / 4.0, 1e-12);

    healpix::pix2ang_ring(1, 4, theta, phi);            // equator
    EXPECT_NEAR(theta, pi / 2.0, 1e-12);
    EXPECT_NEAR(phi, 0.0, 1e-12);

    healpix::pix2ang_ring(1, 11, theta, phi);           // south cap
    EXPECT_NEAR(theta, std::acos(-2.0 / 3.0), 1e-12);
    EXPECT_NEAR(phi, 7.0 * pi / 4.0, 1e-12);
}

TEST(HealpixTest, PixelVectorsAreUnitAndBalanced) {
    const long nside = 8;
    Eigen::Vector3d sum = Eigen::Vector3d::Zero();
    for (long p = 0; p < healpix::nside2npix(nside); ++p) {
        const Eigen::Vector3d n = healpix::pix2vec_ring(nside, p);
        EXPECT_NEAR(n.norm(), 1.0, 1e-12);
        sum += n;
    }
    EXPECT_LT(sum.norm(), 1e-9);
}

TEST(HealpixTest, RingZIsMonotonic) {
    const long nside = 4;
    double prev_z = 1.0;
    for (long p = 0; p < healpix::nside2npix(nside); ++p) {
        const double z = healpix::pix2vec_ring(nside, p).z();
        EXPECT_LE(z, prev_z + 1e-12);
        prev_z = z;
    }
}

TEST(HealpixTest, PixelOutOfRangeThrows) {
    double theta = 0.0, phi = 0.0;
    EXPECT_THROW(healpix::pix2ang_ring(1, 12, theta, phi), std::out_of_range);
    EXPECT_THROW(healpix::pix2ang_ring(1, -1, theta, phi), std::out_of_range);
}

} // namespace
