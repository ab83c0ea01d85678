#pragma once
#include "Types.hpp"
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace skymodel {

/* Base dimensions of the runtime unit model.  Rayleigh-Jeans and
 * thermodynamic (CMB) temperatures are kept apart: they only convert into
 * each other through a frequency dependent equivalency.                    */
enum BaseDimension : int {
    kTime = 0,
    kLength,
    kMass,
    kTemperatureRJ,
    kTemperatureCMB,
    kSolidAngle,
    kAngle,
    kNumDimensions
};

using Dimension = std::array<int, kNumDimensions>;

struct Unit {
    std::string name;
    double      scale = 1.0;     // value in SI of one unit
    Dimension   dim{};

    Unit() = default;
    Unit(std::string n, double s, Dimension d)
        : name(std::move(n)), scale(s), dim(d) {}

    bool dimensionless() const;
    bool same_dimension(const Unit& other) const { return dim == other.dim; }
    bool operator==(const Unit& other) const;
    bool operator!=(const Unit& other) const { return !(*this == other); }

    Unit operator*(const Unit& other) const;
    Unit operator/(const Unit& other) const;
    Unit pow(int n) const;

    // Parse "GHz", "uK_RJ", "MJy/sr", "K km/s", "mJy*sr", "" ...
    static Unit parse(const std::string& text);
};

namespace dims {
    inline constexpr Dimension none       {0, 0, 0, 0, 0, 0, 0};
    inline constexpr Dimension time       {1, 0, 0, 0, 0, 0, 0};
    inline constexpr Dimension frequency  {-1, 0, 0, 0, 0, 0, 0};
    inline constexpr Dimension length     {0, 1, 0, 0, 0, 0, 0};
    inline constexpr Dimension mass       {0, 0, 1, 0, 0, 0, 0};
    inline constexpr Dimension temp_rj    {0, 0, 0, 1, 0, 0, 0};
    inline constexpr Dimension temp_cmb   {0, 0, 0, 0, 1, 0, 0};
    inline constexpr Dimension solid_angle{0, 0, 0, 0, 0, 1, 0};
    inline constexpr Dimension angle      {0, 0, 0, 0, 0, 0, 1};
    inline constexpr Dimension velocity   {-1, 1, 0, 0, 0, 0, 0};
    // W m^-2 Hz^-1 == kg s^-2
    inline constexpr Dimension flux_density{-2, 0, 1, 0, 0, 0, 0};
    // W m^-2 Hz^-1 sr^-1
    inline constexpr Dimension intensity   {-2, 0, 1, 0, 0, -1, 0};
} // namespace dims

namespace units {
    inline const Unit dimensionless{"", 1.0, dims::none};

    inline const Unit s   {"s",   1.0,  dims::time};
    inline const Unit Hz  {"Hz",  1.0,  dims::frequency};
    inline const Unit kHz {"kHz", 1e3,  dims::frequency};
    inline const Unit MHz {"MHz", 1e6,  dims::frequency};
    inline const Unit GHz {"GHz", 1e9,  dims::frequency};
    inline const Unit THz {"THz", 1e12, dims::frequency};

    inline const Unit m   {"m",   1.0,  dims::length};
    inline const Unit km  {"km",  1e3,  dims::length};
    inline const Unit cm  {"cm",  1e-2, dims::length};
    inline const Unit mm  {"mm",  1e-3, dims::length};
    inline const Unit um  {"um",  1e-6, dims::length};

    inline const Unit kg  {"kg",  1.0,  dims::mass};

    inline const Unit K_RJ  {"K_RJ",  1.0,  dims::temp_rj};
    inline const Unit mK_RJ {"mK_RJ", 1e-3, dims::temp_rj};
    inline const Unit uK_RJ {"uK_RJ", 1e-6, dims::temp_rj};
    inline const Unit K     {"K",     1.0,  dims::temp_rj};
    inline const Unit mK    {"mK",    1e-3, dims::temp_rj};
    inline const Unit uK    {"uK",    1e-6, dims::temp_rj};

    inline const Unit K_CMB  {"K_CMB",  1.0,  dims::temp_cmb};
    inline const Unit mK_CMB {"mK_CMB", 1e-3, dims::temp_cmb};
    inline const Unit uK_CMB {"uK_CMB", 1e-6, dims::temp_cmb};

    inline const Unit Jy  {"Jy",  1e-26, dims::flux_density};
    inline const Unit mJy {"mJy", 1e-29, dims::flux_density};
    inline const Unit kJy {"kJy", 1e-23, dims::flux_density};
    inline const Unit MJy {"MJy", 1e-20, dims::flux_density};

    inline const Unit sr     {"sr",     1.0, dims::solid_angle};
    inline const Unit rad    {"rad",    1.0, dims::angle};
    inline const Unit deg    {"deg",    0.017453292519943295, dims::angle};
    inline const Unit arcmin {"arcmin", 0.017453292519943295 / 60.0, dims::angle};

    inline const Unit km_per_s{"km / s", 1e3, dims::velocity};
} // namespace units

/* A frequency dependent conversion between two dimensions.  Both functions
 * map SI values to SI values; the bound frequency array is broadcast
 * against the converted values.                                            */
struct Equivalency {
    Dimension from;
    Dimension to;
    std::function<Array2D(const Array2D&)> forward;
    std::function<Array2D(const Array2D&)> backward;
};

using Equivalencies = std::vector<Equivalency>;

// wavelength <-> frequency
Equivalencies spectral();

// Rayleigh-Jeans K <-> intensity, K_CMB <-> K_RJ, K_CMB <-> intensity
Equivalencies brightness_temperature(const Array2D& freq_hz);

// K_CMB <-> intensity only
Equivalencies thermodynamic_temperature(const Array2D& freq_hz);

// Concatenate two equivalency lists
Equivalencies operator+(Equivalencies lhs, const Equivalencies& rhs);

} // namespace skymodel
