#include "skymodel/SpectralModels.hpp"
#include "skymodel/Broadcast.hpp"
#include "skymodel/Constants.hpp"

#include <algorithm>
#include <boost/math/constants/constants.hpp>
#include <cmath>
#include <stdexcept>

namespace skymodel {
namespace sed {
namespace {

constexpr double kAmePeakReference = 30e9;    // Hz, spdust2 peak frequency

std::pair<Index, Index> common_shape(const Array2D& a, const Array2D& b, const Array2D& c)
{
    const auto [r, k] = broadcast_shape(a, b);
    return broadcast_shape(r, k, c.rows(), c.cols());
}

/* expm1(a) / expm1(b); for large arguments both are rewritten with e^-a so
 * the ratio never turns into inf / inf. */
double expm1_ratio(double a, double b)
{
    if (std::max(a, b) > 30.0)
        return std::exp(a - b) * std::expm1(-a) / std::expm1(-b);
    return std::expm1(a) / std::expm1(b);
}

double gaunt(double freq_ghz, double T_e)
{
    using boost::math::double_constants::pi;
    using boost::math::double_constants::root_three;
    using boost::math::double_constants::e;

    const double a = 5.96 - (root_three / pi)
                   * std::log(freq_ghz * std::pow(T_e * 1e-4, -1.5));
    // ln(e^a + e), rearranged so e^a cannot overflow
    if (a > 1.0) return a + std::log1p(std::exp(1.0 - a));
    return std::log(std::exp(a) + e);
}

} // unnamed namespace

Array2D power_law(double freq, const Array2D& freq_ref, const Array2D& index)
{
    const Array2D ratio = freq / freq_ref;
    return broadcast_apply(ratio, index, [](const Array2D& r, const Array2D& p) -> Array2D {
        return r.binaryExpr(p, [](double x, double e) { return std::pow(x, e); });
    });
}

Array2D blackbody_emission(double freq, const Array2D& T)
{
    const double prefactor = 2.0 * constants::h * freq * freq * freq
                           / (constants::c * constants::c);
    return T.unaryExpr([&](double t) {
        return prefactor / std::expm1(constants::h * freq / (constants::k_B * t));
    });
}

Array2D modified_blackbody(double freq, const Array2D& freq_ref,
                           const Array2D& beta, const Array2D& T)
{
    const auto [rows, cols] = common_shape(freq_ref, beta, T);
    const Array2D nu0 = broadcast_to(freq_ref, rows, cols);
    const Array2D b   = broadcast_to(beta,     rows, cols);
    const Array2D t   = broadcast_to(T,        rows, cols);

    constexpr double h_over_k = constants::h / constants::k_B;
    Array2D out(rows, cols);
    for (Index j = 0; j < cols; ++j) {
        for (Index i = 0; i < rows; ++i) {
            const double r     = freq / nu0(i, j);
            const double x     = h_over_k * freq / t(i, j);
            const double x_ref = h_over_k * nu0(i, j) / t(i, j);
            // B(nu)/B(nu0) = (nu/nu0)^3 * expm1(x0) / expm1(x)
            out(i, j) = std::pow(r, b(i, j) - 2.0) * r * r * r * expm1_ratio(x_ref, x);
        }
    }
    return out;
}

Array2D gaunt_factor(const Array2D& freq_ghz, const Array2D& T_e)
{
    return broadcast_apply(freq_ghz, T_e, [](const Array2D& nu, const Array2D& te) -> Array2D {
        return nu.binaryExpr(te, [](double n, double t) { return gaunt(n, t); });
    });
}

Array2D free_free(double freq, const Array2D& freq_ref, const Array2D& T_e)
{
    const Array2D nu        = Array2D::Constant(1, 1, freq * 1e-9);
    const Array2D g         = gaunt_factor(nu, T_e);
    const Array2D g_ref     = gaunt_factor(freq_ref * 1e-9, T_e);
    const Array2D geometric = (freq_ref / freq).square();

    const Array2D ratio = broadcast_apply(g, g_ref,
        [](const Array2D& a, const Array2D& b) -> Array2D { return a / b; });
    return broadcast_apply(geometric, ratio,
        [](const Array2D& a, const Array2D& b) -> Array2D { return a * b; });
}

double thermodynamical_to_brightness(double freq)
{
    const double x  = constants::h * freq / (constants::k_B * constants::T_0);
    // log form: e^-x alone would underflow before the full product does
    return std::exp(2.0 * std::log(x) - x - 2.0 * std::log(-std::expm1(-x)));
}

double interp_linear(const Eigen::Ref<const Eigen::RowVectorXd>& x,
                     const Eigen::Ref<const Eigen::RowVectorXd>& y,
                     double q)
{
    const Index n = x.size();
    if (n == 0 || n != y.size())
        throw std::invalid_argument("interp_linear: invalid interpolation table.");

    if (q <= x[0])     return y[0];
    if (q >= x[n - 1]) return y[n - 1];

    const double* first = x.data();
    const double* it    = std::upper_bound(first, first + n, q);
    const Index   hi    = static_cast<Index>(it - first);
    const Index   lo    = hi - 1;
    const double  t     = (q - x[lo]) / (x[hi] - x[lo]);
    return (1.0 - t) * y[lo] + t * y[hi];
}

Array2D spinning_dust(double freq, const Array2D& freq_ref,
                      const Array2D& freq_peak,
                      const SpinningDustTemplate& spdust2)
{
    const auto [rows, cols] = broadcast_shape(freq_ref, freq_peak);
    const Array2D peak_scale = broadcast_to(kAmePeakReference / freq_peak, rows, cols);
    const Array2D scaled     = freq * peak_scale;
    const Array2D scaled_ref = broadcast_to(freq_ref, rows, cols) * peak_scale;

    const double lo = spdust2.freq_min();
    const double hi = spdust2.freq_max();
    const bool in_range = (scaled >= lo).all() && (scaled <= hi).all()
                       && (scaled_ref >= lo).all() && (scaled_ref <= hi).all();
    if (!in_range)
        return Array2D::Zero(rows, cols);

    const Eigen::RowVectorXd tf = spdust2.table.row(0);
    const Eigen::RowVectorXd ta = spdust2.table.row(1);
    Array2D out(rows, cols);
    for (Index j = 0; j < cols; ++j)
        for (Index i = 0; i < rows; ++i)
            out(i, j) = interp_linear(tf, ta, scaled(i, j))
                      / interp_linear(tf, ta, scaled_ref(i, j));
    return out;
}

} // namespace sed
} // namespace skymodel
