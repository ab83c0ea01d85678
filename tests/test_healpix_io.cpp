// FITS HEALPix map round trip

#include <gtest/gtest.h>
#include <filesystem>

#include "skymodel/Exceptions.hpp"
#include "skymodel/HealpixIO.hpp"
#include "skymodel/JsonUtils.hpp"

using namespace skymodel;
namespace fs = std::filesystem;

namespace {

Array2D stokes_map(Index stokes, Index npix) {
    Array2D m(stokes, npix);
    for (Index i = 0; i < stokes; ++i)
        for (Index j = 0; j < npix; ++j)
            m(i, j) = 0.5 * static_cast<double>(j) - 10.0 * static_cast<double>(i);
    return m;
}

TEST(HealpixIOTest, WriteThenReadPolarizedMap) {
    const auto path = (fs::temp_directory_path() / "skymodel_iqu.fits").string();
    const Array2D map = stokes_map(3, 48);
    write_healpix_map(path, Quantity(map, units::uK_RJ));

    const Array2D back = read_healpix_map(path);
    ASSERT_EQ(back.rows(), 3);
    ASSERT_EQ(back.cols(), 48);
    EXPECT_TRUE((back == map).all());

    const Array2D intensity = read_healpix_map(path, 1);
    EXPECT_EQ(intensity.rows(), 1);
    EXPECT_TRUE((intensity.row(0) == map.row(0)).all());
    fs::remove(path);
}

TEST(HealpixIOTest, FitsChainField) {
    const auto path = (fs::temp_directory_path() / "skymodel_beta.fits").string();
    write_healpix_map(path, Quantity(Array2D::Constant(1, 12, -3.1), units::dimensionless));

    const ChainField f = chain_field_from_json(
        nlohmann::json{{"fits", path}, {"unit", "dimensionless"}});
    EXPECT_EQ(f.values.rows(), 1);
    EXPECT_EQ(f.values.cols(), 12);
    ASSERT_TRUE(f.unit.has_value());
    EXPECT_TRUE(f.unit->dimensionless());
    fs::remove(path);
}

TEST(HealpixIOTest, RejectsBadInput) {
    EXPECT_THROW(write_healpix_map("unused.fits", Quantity(Array2D::Ones(2, 12), units::K)),
                 std::invalid_argument);
    EXPECT_THROW(write_healpix_map("unused.fits", Quantity(Array2D::Ones(1, 13), units::K)),
                 ResolutionError);
    EXPECT_THROW(read_healpix_map("/nonexistent/skymodel.fits"), std::runtime_error);
    EXPECT_THROW(read_healpix_map("/nonexistent/skymodel.fits", 2), std::invalid_argument);
}

} // namespace
