// Units and Quantity: parsing, conversion, equivalencies, broadcasting

#include <gtest/gtest.h>
#include <cmath>

#include "skymodel/Constants.hpp"
#include "skymodel/Exceptions.hpp"
#include "skymodel/Quantity.hpp"
#include "skymodel/SpectralModels.hpp"

using namespace skymodel;

namespace {

//==============================================================================
// Unit parsing
//==============================================================================

TEST(UnitTest, ParsesSimpleAndCompoundUnits) {
    EXPECT_EQ(Unit::parse("GHz"), units::GHz);
    EXPECT_EQ(Unit::parse("uK_RJ"), units::uK_RJ);
    EXPECT_EQ(Unit::parse(" mJy "), units::mJy);
    EXPECT_TRUE(Unit::parse("").dimensionless());
    EXPECT_TRUE(Unit::parse("dimensionless").dimensionless());

    const Unit mjy_sr = Unit::parse("MJy/sr");
    EXPECT_EQ(mjy_sr.dim, dims::intensity);
    EXPECT_DOUBLE_EQ(mjy_sr.scale, 1e-20);

    const Unit line = Unit::parse("K km/s");
    EXPECT_EQ(line.dim, (units::K_RJ * units::km_per_s).dim);
    EXPECT_DOUBLE_EQ(line.scale, 1.0);

    EXPECT_EQ(Unit::parse("m^2").dim, (units::m * units::m).dim);
}

TEST(UnitTest, RejectsUnknownUnits) {
    EXPECT_THROW(Unit::parse("furlong"), UnitError);
    EXPECT_THROW(Unit::parse("m^x"), UnitError);
    EXPECT_THROW(Unit::parse("Jy//sr"), UnitError);
}

TEST(UnitTest, RayleighJeansAndThermodynamicKelvinDiffer) {
    EXPECT_FALSE(units::K_RJ.same_dimension(units::K_CMB));
    EXPECT_TRUE(units::K.same_dimension(units::uK_RJ));
}

//==============================================================================
// Conversion
//==============================================================================

TEST(QuantityTest, ConvertsBetweenScaledUnits) {
    const Quantity f(30.0, units::GHz);
    EXPECT_DOUBLE_EQ(f.to_value(units::Hz)(0, 0), 30e9);
    EXPECT_DOUBLE_EQ(f.to(units::MHz).value()(0, 0), 30000.0);
    EXPECT_EQ(f.to(units::MHz).unit(), units::MHz);

    const Quantity t(2.5, units::mK_RJ);
    EXPECT_NEAR(t.to_value(units::uK_RJ)(0, 0), 2500.0, 1e-9);
}

TEST(QuantityTest, SpectralEquivalencyMapsWavelengthToFrequency) {
    const Quantity lambda(1.0, units::mm);
    EXPECT_NEAR(lambda.to_value(units::GHz, spectral())(0, 0), 299.792458, 1e-9);
    EXPECT_THROW(lambda.to_value(units::GHz), UnitError);
}

TEST(QuantityTest, BrightnessTemperatureToIntensity) {
    const Quantity nu(100.0, units::GHz);
    const Quantity t(1.0, units::K_RJ);

    const double expected = 2.0 * constants::k_B * 1e22 / (constants::c * constants::c);
    const double got = t.to_value(Unit::parse("W/m^2/Hz/sr"), brightness_temperature(nu))(0, 0);
    EXPECT_NEAR(got / expected, 1.0, 1e-12);

    // and back again through MJy/sr
    const Quantity i = t.to(Unit::parse("MJy/sr"), brightness_temperature(nu));
    EXPECT_NEAR(i.to_value(units::K_RJ, brightness_temperature(nu))(0, 0), 1.0, 1e-12);
}

TEST(QuantityTest, CmbToRayleighJeansMatchesScalingFactor) {
    const Quantity nu(100.0, units::GHz);
    const Quantity t(1.0, units::K_CMB);

    EXPECT_THROW(t.to_value(units::K_RJ), UnitError);
    const double rj = t.to_value(units::K_RJ, brightness_temperature(nu))(0, 0);
    EXPECT_NEAR(rj, sed::thermodynamical_to_brightness(100e9), 1e-12);

    // Rayleigh-Jeans limit
    const double low = t.to_value(units::K_RJ, brightness_temperature(Quantity(1.0, units::GHz)))(0, 0);
    EXPECT_NEAR(low, 1.0, 1e-3);
}

TEST(QuantityTest, ThermodynamicTemperatureOnlyLinksCmbAndIntensity) {
    const Quantity nu(143.0, units::GHz);
    const Quantity t(1.0, units::uK_CMB);
    EXPECT_TRUE(t.convertible_to(Unit::parse("MJy/sr"), thermodynamic_temperature(nu)));
    EXPECT_FALSE(t.convertible_to(units::uK_RJ, thermodynamic_temperature(nu)));
    EXPECT_TRUE(t.convertible_to(units::uK_RJ, brightness_temperature(nu)));
}

TEST(QuantityTest, FrequencyDependentEquivalencyBroadcasts) {
    Array2D f(1, 3);
    f << 10.0, 100.0, 1000.0;
    const Quantity t(Array2D::Ones(1, 3), units::K_RJ);
    const Array2D i = t.to_value(Unit::parse("Jy/sr"), brightness_temperature(Quantity(f, units::GHz)));
    ASSERT_EQ(i.cols(), 3);
    EXPECT_NEAR(i(0, 1) / i(0, 0), 100.0, 1e-9);
    EXPECT_NEAR(i(0, 2) / i(0, 1), 100.0, 1e-9);
}

//==============================================================================
// Arithmetic
//==============================================================================

TEST(QuantityTest, MultiplicationBroadcastsAndCombinesUnits) {
    const Quantity a(Array2D::Constant(3, 1, 2.0), units::K_RJ);
    const Quantity b(Array2D::Constant(1, 4, 3.0), units::sr);
    const Quantity p = a * b;
    EXPECT_EQ(p.rows(), 3);
    EXPECT_EQ(p.cols(), 4);
    EXPECT_TRUE((p.value() == 6.0).all());
    EXPECT_EQ(p.unit().dim, (units::K_RJ * units::sr).dim);

    const Quantity q = p / units::sr;
    EXPECT_EQ(q.unit().dim, units::K_RJ.dim);
}

TEST(QuantityTest, AdditionConvertsRightOperand) {
    const Quantity a(1.0, units::K_RJ);
    const Quantity b(500.0, units::mK_RJ);
    const Quantity s = a + b;
    EXPECT_EQ(s.unit(), units::K_RJ);
    EXPECT_DOUBLE_EQ(s.value()(0, 0), 1.5);
    EXPECT_DOUBLE_EQ((a - b).value()(0, 0), 0.5);
}

TEST(QuantityTest, IncompatibleOperandsThrow) {
    EXPECT_THROW(Quantity(1.0, units::K_RJ) + Quantity(1.0, units::GHz), UnitError);
    const Quantity a(Array2D::Ones(2, 3), units::K_RJ);
    const Quantity b(Array2D::Ones(3, 3), units::K_RJ);
    EXPECT_THROW(a + b, ShapeError);
}

TEST(QuantityTest, RowAndReshape) {
    Array2D v(1, 3);
    v << 1.0, 2.0, 3.0;
    const Quantity q(v, units::GHz);

    const Quantity col = q.reshaped(3, 1);
    EXPECT_EQ(col.rows(), 3);
    EXPECT_DOUBLE_EQ(col.value()(2, 0), 3.0);
    EXPECT_THROW(q.reshaped(2, 2), ShapeError);

    EXPECT_DOUBLE_EQ(col.row(1).value()(0, 0), 2.0);
    EXPECT_THROW(col.row(3), ShapeError);
    EXPECT_EQ(q.shape_str(), "(1, 3)");
}

TEST(QuantityTest, ScalarTimesUnitBuildsQuantity) {
    const Quantity f = 30.0 * units::GHz;
    EXPECT_EQ(f.size(), 1);
    EXPECT_EQ(f.unit(), units::GHz);
}

} // namespace
