#pragma once

#include <cmath>
#include <limits>

namespace riskgate {
namespace statistics {
namespace normal {

constexpr double kInvSqrt2Pi = 0.3989422804014327;  // 1 / sqrt(2*pi)
constexpr double kSqrt2 = 1.4142135623730951;
constexpr double kSqrt2Pi = 2.5066282746310002;

/**
 * @brief Standard normal density
 */
inline double pdf(double x) {
    return kInvSqrt2Pi * std::exp(-0.5 * x * x);
}

/**
 * @brief Standard normal cumulative distribution
 */
inline double cdf(double x) {
    return 0.5 * std::erfc(-x / kSqrt2);
}

// ============================================================================
// Quantile: Acklam (2003) rational approximation
// ============================================================================
// Relative error of the raw approximation is below 1.15e-9; one Halley step
// against erfc brings it to full double precision.

namespace detail {

constexpr double a[6] = {-3.969683028665376e+01, 2.209460984245205e+02,
                         -2.759285104469687e+02, 1.383577518672690e+02,
                         -3.066479806614716e+01, 2.506628277459239e+00};
constexpr double b[5] = {-5.447609879822406e+01, 1.615858368580409e+02,
                         -1.556989798598866e+02, 6.680131188771972e+01,
                         -1.328068155288572e+01};
constexpr double c[6] = {-7.784894002430293e-03, -3.223964580411365e-01,
                         -2.400758277161838e+00, -2.549732539343734e+00,
                         4.374664141464968e+00,  2.938163982698783e+00};
constexpr double d[4] = {7.784695709041462e-03, 3.224671290700398e-01,
                         2.445134137142996e+00, 3.754408661907416e+00};

constexpr double kLowTail = 0.02425;

inline double acklam(double p) {
    if (p < kLowTail) {
        double q = std::sqrt(-2.0 * std::log(p));
        return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    if (p > 1.0 - kLowTail) {
        double q = std::sqrt(-2.0 * std::log(1.0 - p));
        return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
               ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
    }
    double q = p - 0.5;
    double r = q * q;
    return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
           (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
}

}  // namespace detail

/**
 * @brief Inverse of the standard normal CDF
 * @param p Probability in (0, 1)
 * @return Quantile; -inf / +inf at 0 / 1, NaN outside [0, 1]
 */
inline double ppf(double p) {
    if (std::isnan(p) || p < 0.0 || p > 1.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (p == 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    if (p == 1.0) {
        return std::numeric_limits<double>::infinity();
    }

    double x = detail::acklam(p);
    double e = cdf(x) - p;
    double u = e * kSqrt2Pi * std::exp(0.5 * x * x);
    return x - u / (1.0 + 0.5 * x * u);
}

}  // namespace normal
}  // namespace statistics
}  // namespace riskgate
