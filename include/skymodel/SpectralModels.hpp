#pragma once
#include "Templates.hpp"
#include "Types.hpp"

/* Frequency scaling kernels.  Frequencies are in Hz and temperatures in K;
 * array arguments broadcast against each other (see Broadcast.hpp), `freq`
 * is the single frequency being evaluated and `freq_ref` the (S, 1)
 * reference frequencies of the component.  Every kernel returns the
 * dimensionless ratio emission(freq) / emission(freq_ref).                 */

namespace skymodel {
namespace sed {

// (freq / freq_ref)^index
Array2D power_law(double freq, const Array2D& freq_ref, const Array2D& index);

// Planck spectral radiance B(nu, T) [W m^-2 Hz^-1 sr^-1], via expm1
Array2D blackbody_emission(double freq, const Array2D& T);

// (freq / freq_ref)^(beta - 2) * B(freq, T) / B(freq_ref, T)
Array2D modified_blackbody(double freq, const Array2D& freq_ref,
                           const Array2D& beta, const Array2D& T);

// Draine (2011) style Gaunt factor, freq in GHz and T_e in K
Array2D gaunt_factor(const Array2D& freq_ghz, const Array2D& T_e);

// (freq_ref / freq)^2 * g(freq, T_e) / g(freq_ref, T_e)
Array2D free_free(double freq, const Array2D& freq_ref, const Array2D& T_e);

// x^2 e^x / (e^x - 1)^2 with x = h freq / (k_B T0), freq > 0 in Hz.
// Strictly positive in double precision up to x ~ 750 (about 4e13 Hz); the
// value underflows to 0 above that.
double thermodynamical_to_brightness(double freq);

// np.interp semantics: clamps to the end values outside [x0, xn]
double interp_linear(const Eigen::Ref<const Eigen::RowVectorXd>& x,
                     const Eigen::Ref<const Eigen::RowVectorXd>& y,
                     double q);

/* spdust2 template shifted by 30 GHz / freq_peak.  Where a shifted
 * frequency falls outside the template the model is undefined and the
 * whole result is zero, keeping the broadcast shape.                      */
Array2D spinning_dust(double freq, const Array2D& freq_ref,
                      const Array2D& freq_peak,
                      const SpinningDustTemplate& spdust2);

} // namespace sed
} // namespace skymodel
