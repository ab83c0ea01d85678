#pragma once
#include "Exceptions.hpp"
#include "Types.hpp"
#include <string>
#include <utility>

namespace skymodel {

/* Two-axis NumPy style broadcasting: an axis broadcasts if it is equal on
 * both sides or of size 1 on one side.                                     */
inline std::pair<Index, Index>
broadcast_shape(Index r1, Index c1, Index r2, Index c2)
{
    auto axis = [](Index a, Index b, const char* name) -> Index {
        if (a == b || b == 1) return a;
        if (a == 1) return b;
        throw ShapeError(std::string("cannot broadcast ") + name + " axis: "
                         + std::to_string(a) + " vs " + std::to_string(b));
    };
    return { axis(r1, r2, "stokes"), axis(c1, c2, "pixel") };
}

inline std::pair<Index, Index>
broadcast_shape(const Array2D& a, const Array2D& b)
{
    return broadcast_shape(a.rows(), a.cols(), b.rows(), b.cols());
}

inline Array2D broadcast_to(const Array2D& a, Index rows, Index cols)
{
    if (a.rows() == rows && a.cols() == cols) return a;
    if ((a.rows() != rows && a.rows() != 1) ||
        (a.cols() != cols && a.cols() != 1) || a.size() == 0)
        throw ShapeError("cannot broadcast (" + std::to_string(a.rows()) + ", "
                         + std::to_string(a.cols()) + ") to ("
                         + std::to_string(rows) + ", " + std::to_string(cols) + ")");
    return a.replicate(rows / a.rows(), cols / a.cols());
}

// Apply an element-wise binary op after bringing both operands to a common shape
template <typename Op>
Array2D broadcast_apply(const Array2D& a, const Array2D& b, Op op)
{
    const auto [rows, cols] = broadcast_shape(a, b);
    return op(broadcast_to(a, rows, cols), broadcast_to(b, rows, cols));
}

} // namespace skymodel
