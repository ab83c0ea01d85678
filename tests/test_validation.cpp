// Shape, resolution and unit validation of component inputs

#include <gtest/gtest.h>

#include "skymodel/Exceptions.hpp"
#include "skymodel/Validation.hpp"

using namespace skymodel;

namespace {

Quantity map_of(Index stokes, Index npix, const Unit& unit = units::uK_RJ) {
    return Quantity(Array2D::Ones(stokes, npix), unit);
}

PointSourceCatalog catalog_of(Index n) {
    PointSourceCatalog cat;
    cat.coords = Eigen::Matrix2Xd::Zero(2, n);
    return cat;
}

const Quantity kFreq30(30.0, units::GHz);

//==============================================================================
// Reference frequency
//==============================================================================

TEST(ValidationTest, FreqRefShapes) {
    EXPECT_NO_THROW(validate_freq_ref(kFreq30));
    EXPECT_NO_THROW(validate_freq_ref(Quantity(Array2D::Constant(3, 1, 30.0), units::GHz)));
    EXPECT_NO_THROW(validate_freq_ref(Quantity(1.0, units::cm)));

    EXPECT_THROW(validate_freq_ref(Quantity(Array2D::Constant(2, 1, 30.0), units::GHz)), ShapeError);
    EXPECT_THROW(validate_freq_ref(Quantity(Array2D::Constant(1, 3, 30.0), units::GHz)), ShapeError);
    EXPECT_THROW(validate_freq_ref(Quantity(30.0, units::K)), UnitError);
    EXPECT_THROW(validate_freq_ref(Quantity()), TypeError);
}

//==============================================================================
// Diffuse
//==============================================================================

TEST(ValidationTest, DiffuseAcceptsValidMaps) {
    EXPECT_NO_THROW(validate_diffuse(map_of(1, 12), kFreq30, {}));
    EXPECT_NO_THROW(validate_diffuse(map_of(1, 48, units::uK_CMB), kFreq30, {}));
    EXPECT_NO_THROW(validate_diffuse(map_of(1, 12, Unit::parse("MJy/sr")), kFreq30, {}));
    EXPECT_NO_THROW(validate_diffuse(map_of(3, 12),
                                     Quantity(Array2D::Constant(3, 1, 30.0), units::GHz),
                                     {{"beta", Quantity(Array2D::Constant(3, 12, -3.0), units::dimensionless)}}));
}

TEST(ValidationTest, DiffuseRejectsBadResolution) {
    EXPECT_THROW(validate_diffuse(map_of(1, 13), kFreq30, {}), ResolutionError);
    EXPECT_THROW(validate_diffuse(map_of(1, 12), kFreq30,
                                  {{"beta", Quantity(Array2D::Zero(1, 13), units::dimensionless)}}),
                 ResolutionError);
}

TEST(ValidationTest, DiffuseParameterMapMustMatchAmplitudeResolution) {
    // nside 2 parameter map on an nside 1 amplitude map
    EXPECT_THROW(validate_diffuse(map_of(1, 12), kFreq30,
                                  {{"beta", Quantity(Array2D::Zero(1, 48), units::dimensionless)}}),
                 ShapeError);
    EXPECT_NO_THROW(validate_diffuse(map_of(1, 48), kFreq30,
                                     {{"beta", Quantity(Array2D::Zero(1, 48), units::dimensionless)}}));
}

TEST(ValidationTest, DiffuseRejectsStokesMismatch) {
    EXPECT_THROW(validate_diffuse(map_of(3, 12), kFreq30, {}), ShapeError);
    EXPECT_THROW(validate_diffuse(map_of(1, 12), kFreq30,
                                  {{"beta", Quantity(Array2D::Zero(3, 1), units::dimensionless)}}),
                 ShapeError);
}

TEST(ValidationTest, DiffuseRejectsFluxUnits) {
    EXPECT_THROW(validate_diffuse(map_of(1, 12, units::Jy), kFreq30, {}), UnitError);
    EXPECT_THROW(validate_diffuse(map_of(1, 12, units::GHz), kFreq30, {}), UnitError);
}

TEST(ValidationTest, EmptyQuantitiesAreTypeErrors) {
    EXPECT_THROW(validate_diffuse(Quantity(Array2D(0, 0), units::uK_RJ), kFreq30, {}), TypeError);
    EXPECT_THROW(validate_diffuse(map_of(1, 12), kFreq30,
                                  {{"beta", Quantity(Array2D(0, 0), units::dimensionless)}}),
                 TypeError);
}

//==============================================================================
// Point sources
//==============================================================================

TEST(ValidationTest, PointSourceFluxAmplitudes) {
    EXPECT_NO_THROW(validate_point_source(map_of(1, 5, units::mJy), kFreq30, catalog_of(5), {}));
    EXPECT_NO_THROW(validate_point_source(map_of(1, 5, units::mJy), kFreq30, catalog_of(5),
                                          {{"alpha", Quantity(Array2D::Zero(1, 5), units::dimensionless)}}));

    EXPECT_THROW(validate_point_source(map_of(1, 5, units::uK_RJ), kFreq30, catalog_of(5), {}),
                 UnitError);
    EXPECT_THROW(validate_point_source(map_of(1, 5, units::mJy), kFreq30, catalog_of(4), {}),
                 ShapeError);
    EXPECT_THROW(validate_point_source(map_of(1, 5, units::mJy), kFreq30, catalog_of(5),
                                       {{"alpha", Quantity(Array2D::Zero(1, 4), units::dimensionless)}}),
                 ShapeError);
}

TEST(ValidationTest, PointSourceCountNeedNotBeHealpix) {
    EXPECT_NO_THROW(validate_point_source(map_of(1, 7, units::Jy), kFreq30, catalog_of(7), {}));
}

//==============================================================================
// Line emission
//==============================================================================

TEST(ValidationTest, LineNeedsVelocityIntegratedBrightness) {
    EXPECT_NO_THROW(validate_line(map_of(1, 12, Unit::parse("K km/s")), kFreq30));
    EXPECT_THROW(validate_line(map_of(1, 12, units::K), kFreq30), UnitError);
}

} // namespace
