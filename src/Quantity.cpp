#include "skymodel/Quantity.hpp"
#include "skymodel/Broadcast.hpp"
#include "skymodel/Exceptions.hpp"

#include <sstream>

namespace skymodel {
namespace {

std::string describe(const Unit& u)
{
    return u.name.empty() ? std::string("dimensionless") : "'" + u.name + "'";
}

} // unnamed namespace

Quantity::Quantity(Array2D value, Unit unit)
    : value_(std::move(value)), unit_(std::move(unit))
{}

Quantity::Quantity(double value, Unit unit)
    : value_(Array2D::Constant(1, 1, value)), unit_(std::move(unit))
{}

std::string Quantity::shape_str() const
{
    std::ostringstream s;
    s << "(" << rows() << ", " << cols() << ")";
    return s.str();
}

bool Quantity::convertible_to(const Unit& target, const Equivalencies& eq) const
{
    if (unit_.same_dimension(target)) return true;
    for (const auto& e : eq) {
        if (e.from == unit_.dim && e.to == target.dim) return true;
        if (e.to == unit_.dim && e.from == target.dim) return true;
    }
    return false;
}

Array2D Quantity::to_value(const Unit& target, const Equivalencies& eq) const
{
    if (unit_.same_dimension(target))
        return value_ * (unit_.scale / target.scale);

    const Array2D si = value_ * unit_.scale;
    for (const auto& e : eq) {
        if (e.from == unit_.dim && e.to == target.dim)
            return e.forward(si) / target.scale;
        if (e.to == unit_.dim && e.from == target.dim)
            return e.backward(si) / target.scale;
    }
    throw UnitError("cannot convert " + describe(unit_) + " to " + describe(target));
}

Quantity Quantity::to(const Unit& target, const Equivalencies& eq) const
{
    return Quantity(to_value(target, eq), target);
}

Quantity Quantity::row(Index i) const
{
    if (i < 0 || i >= rows())
        throw ShapeError("row " + std::to_string(i) + " out of range for shape " + shape_str());
    return Quantity(Array2D(value_.row(i)), unit_);
}

Quantity Quantity::reshaped(Index r, Index c) const
{
    if (r * c != size())
        throw ShapeError("cannot reshape " + shape_str() + " into ("
                         + std::to_string(r) + ", " + std::to_string(c) + ")");
    return Quantity(Array2D(Eigen::Map<const Array2D>(value_.data(), r, c)), unit_);
}

Quantity operator*(const Quantity& a, const Quantity& b)
{
    return Quantity(broadcast_apply(a.value(), b.value(),
                        [](const Array2D& x, const Array2D& y) -> Array2D { return x * y; }),
                    a.unit() * b.unit());
}

Quantity operator/(const Quantity& a, const Quantity& b)
{
    return Quantity(broadcast_apply(a.value(), b.value(),
                        [](const Array2D& x, const Array2D& y) -> Array2D { return x / y; }),
                    a.unit() / b.unit());
}

Quantity operator+(const Quantity& a, const Quantity& b)
{
    const Array2D rhs = b.to_value(a.unit());
    return Quantity(broadcast_apply(a.value(), rhs,
                        [](const Array2D& x, const Array2D& y) -> Array2D { return x + y; }),
                    a.unit());
}

Quantity operator-(const Quantity& a, const Quantity& b)
{
    const Array2D rhs = b.to_value(a.unit());
    return Quantity(broadcast_apply(a.value(), rhs,
                        [](const Array2D& x, const Array2D& y) -> Array2D { return x - y; }),
                    a.unit());
}

Quantity operator*(const Quantity& a, double s)  { return Quantity(a.value() * s, a.unit()); }
Quantity operator*(double s, const Quantity& a)  { return a * s; }
Quantity operator*(const Quantity& a, const Unit& u) { return Quantity(a.value(), a.unit() * u); }
Quantity operator/(const Quantity& a, const Unit& u) { return Quantity(a.value(), a.unit() / u); }
Quantity operator*(double v, const Unit& u)      { return Quantity(v, u); }

Equivalencies brightness_temperature(const Quantity& freq)
{
    return brightness_temperature(freq.to_value(units::Hz, spectral()));
}

Equivalencies thermodynamic_temperature(const Quantity& freq)
{
    return thermodynamic_temperature(freq.to_value(units::Hz, spectral()));
}

} // namespace skymodel
