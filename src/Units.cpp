#include "skymodel/Units.hpp"
#include "skymodel/Broadcast.hpp"
#include "skymodel/Constants.hpp"
#include "skymodel/Exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace skymodel {
namespace {

std::string trim(const std::string& s)
{
    auto b = std::find_if_not(s.begin(), s.end(), ::isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), ::isspace).base();
    return (b < e) ? std::string(b, e) : std::string();
}

const std::unordered_map<std::string, Unit>& unit_table()
{
    static const std::unordered_map<std::string, Unit> table = {
        {"s", units::s},       {"Hz", units::Hz},     {"kHz", units::kHz},
        {"MHz", units::MHz},   {"GHz", units::GHz},   {"THz", units::THz},
        {"m", units::m},       {"km", units::km},     {"cm", units::cm},
        {"mm", units::mm},     {"um", units::um},     {"micron", units::um},
        {"kg", units::kg},
        {"K", units::K},       {"mK", units::mK},     {"uK", units::uK},
        {"K_RJ", units::K_RJ}, {"mK_RJ", units::mK_RJ}, {"uK_RJ", units::uK_RJ},
        {"K_CMB", units::K_CMB}, {"mK_CMB", units::mK_CMB}, {"uK_CMB", units::uK_CMB},
        {"Jy", units::Jy},     {"mJy", units::mJy},   {"kJy", units::kJy},
        {"MJy", units::MJy},
        {"W", Unit("W", 1.0, {-3, 2, 1, 0, 0, 0, 0})},
        {"sr", units::sr},     {"rad", units::rad},   {"deg", units::deg},
        {"arcmin", units::arcmin},
    };
    return table;
}

// One factor such as "GHz" or "m^2"
Unit parse_factor(const std::string& token)
{
    std::string base = token;
    int power = 1;
    if (auto caret = token.find('^'); caret != std::string::npos) {
        base = token.substr(0, caret);
        try {
            power = std::stoi(token.substr(caret + 1));
        } catch (const std::exception&) {
            throw UnitError("invalid unit exponent in '" + token + "'");
        }
    }
    const auto& table = unit_table();
    auto it = table.find(base);
    if (it == table.end())
        throw UnitError("unknown unit '" + base + "'");
    return it->second.pow(power);
}

// Product of factors separated by '*' or whitespace
Unit parse_product(const std::string& text)
{
    std::string spaced = text;
    std::replace(spaced.begin(), spaced.end(), '*', ' ');
    std::istringstream ss(spaced);
    Unit out = units::dimensionless;
    std::string token;
    while (ss >> token) out = out * parse_factor(token);
    return out;
}

/* 2 k nu^2 / c^2 : Rayleigh-Jeans intensity per kelvin */
Array2D rj_factor(const Array2D& freq)
{
    return 2.0 * constants::k_B * freq.square()
           / (constants::c * constants::c);
}

/* dT_RJ / dT_CMB = x^2 e^x / (e^x - 1)^2, x = h nu / k T0,
 * written with e^-x so it stays finite for large x. */
Array2D cmb_factor(const Array2D& freq)
{
    const Array2D x = constants::h * freq / (constants::k_B * constants::T_0);
    const Array2D em = -(-x).unaryExpr([](double v) { return std::expm1(v); });
    return x.square() * (-x).exp() / em.square();
}

Equivalency scaled(const Dimension& from, const Dimension& to, const Array2D& factor)
{
    return Equivalency{
        from, to,
        [factor](const Array2D& v) -> Array2D {
            return broadcast_apply(v, factor,
                [](const Array2D& a, const Array2D& b) -> Array2D { return a * b; });
        },
        [factor](const Array2D& v) -> Array2D {
            return broadcast_apply(v, factor,
                [](const Array2D& a, const Array2D& b) -> Array2D { return a / b; });
        }};
}

} // unnamed namespace

bool Unit::dimensionless() const
{
    return dim == dims::none;
}

bool Unit::operator==(const Unit& other) const
{
    if (dim != other.dim) return false;
    return std::abs(scale - other.scale) <= 1e-12 * std::max(std::abs(scale), std::abs(other.scale));
}

Unit Unit::operator*(const Unit& other) const
{
    Dimension d{};
    for (int i = 0; i < kNumDimensions; ++i) d[i] = dim[i] + other.dim[i];
    std::string n = name.empty() ? other.name
                  : other.name.empty() ? name
                  : name + " " + other.name;
    return Unit(n, scale * other.scale, d);
}

Unit Unit::operator/(const Unit& other) const
{
    Dimension d{};
    for (int i = 0; i < kNumDimensions; ++i) d[i] = dim[i] - other.dim[i];
    std::string n = other.name.empty() ? name
                  : (name.empty() ? "1" : name) + " / " + other.name;
    return Unit(n, scale / other.scale, d);
}

Unit Unit::pow(int n) const
{
    if (n == 1) return *this;
    Dimension d{};
    for (int i = 0; i < kNumDimensions; ++i) d[i] = dim[i] * n;
    return Unit(name + "^" + std::to_string(n), std::pow(scale, n), d);
}

Unit Unit::parse(const std::string& text)
{
    const std::string t = trim(text);
    if (t.empty() || t == "dimensionless" || t == "1")
        return units::dimensionless;

    const auto slash = t.find('/');
    Unit out = parse_product(t.substr(0, slash));
    if (slash != std::string::npos) {
        std::stringstream rest(t.substr(slash + 1));
        std::string part;
        while (std::getline(rest, part, '/')) {
            if (trim(part).empty())
                throw UnitError("malformed unit '" + text + "'");
            out = out / parse_product(part);
        }
    }
    out.name = t;
    return out;
}

Equivalencies spectral()
{
    auto swap = [](const Array2D& v) -> Array2D { return constants::c / v; };
    return { Equivalency{dims::length, dims::frequency, swap, swap} };
}

Equivalencies brightness_temperature(const Array2D& freq_hz)
{
    const Array2D rj  = rj_factor(freq_hz);
    const Array2D cmb = cmb_factor(freq_hz);
    return {
        scaled(dims::temp_rj, dims::intensity, rj),
        scaled(dims::temp_cmb, dims::temp_rj, cmb),
        scaled(dims::temp_cmb, dims::intensity, rj * cmb),
    };
}

Equivalencies thermodynamic_temperature(const Array2D& freq_hz)
{
    return { scaled(dims::temp_cmb, dims::intensity,
                    rj_factor(freq_hz) * cmb_factor(freq_hz)) };
}

Equivalencies operator+(Equivalencies lhs, const Equivalencies& rhs)
{
    lhs.insert(lhs.end(), rhs.begin(), rhs.end());
    return lhs;
}

} // namespace skymodel
