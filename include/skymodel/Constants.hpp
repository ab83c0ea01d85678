#pragma once
#include "Units.hpp"

namespace skymodel {
namespace constants {
    inline constexpr double h   = 6.62607015e-34;   // J s
    inline constexpr double k_B = 1.380649e-23;     // J / K
    inline constexpr double c   = 299792458.0;      // m / s
    inline constexpr double T_0 = 2.7255;           // K, CMB monopole (BP9)
} // namespace constants

// Unit every amplitude must be convertible to, and the unit reference
// frequencies are validated against.
inline const Unit DEFAULT_OUTPUT_UNIT = units::uK_RJ;
inline const Unit DEFAULT_FREQ_UNIT   = units::GHz;

} // namespace skymodel
