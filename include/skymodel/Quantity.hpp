#pragma once
#include "Types.hpp"
#include "Units.hpp"
#include <string>

namespace skymodel {

// A (rows, cols) array tagged with a physical unit.  Scalars are (1, 1).
class Quantity {
public:
    Quantity() = default;
    Quantity(Array2D value, Unit unit);
    Quantity(double value, Unit unit);

    const Array2D& value() const { return value_; }
    Array2D&       value()       { return value_; }
    const Unit&    unit()  const { return unit_; }

    Index rows() const { return value_.rows(); }
    Index cols() const { return value_.cols(); }
    Index size() const { return value_.size(); }
    bool  empty() const { return value_.size() == 0; }
    std::string shape_str() const;

    // Conversion; throws UnitError if neither the dimensions nor any of the
    // supplied equivalencies connect the two units.
    Quantity to(const Unit& target, const Equivalencies& eq = {}) const;
    Array2D  to_value(const Unit& target, const Equivalencies& eq = {}) const;
    bool     convertible_to(const Unit& target, const Equivalencies& eq = {}) const;

    Quantity row(Index i) const;
    Quantity reshaped(Index rows, Index cols) const;

private:
    Array2D value_;
    Unit    unit_;
};

// Arithmetic broadcasts over both axes; + and - require equal dimensions
Quantity operator*(const Quantity& a, const Quantity& b);
Quantity operator/(const Quantity& a, const Quantity& b);
Quantity operator+(const Quantity& a, const Quantity& b);
Quantity operator-(const Quantity& a, const Quantity& b);
Quantity operator*(const Quantity& a, double s);
Quantity operator*(double s, const Quantity& a);
Quantity operator*(const Quantity& a, const Unit& u);
Quantity operator/(const Quantity& a, const Unit& u);

// 30.0 * units::GHz
Quantity operator*(double v, const Unit& u);

// Frequency aware equivalencies taking the frequency as a Quantity
Equivalencies brightness_temperature(const Quantity& freq);
Equivalencies thermodynamic_temperature(const Quantity& freq);

} // namespace skymodel
