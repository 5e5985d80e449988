#pragma once

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace riskgate {
namespace core {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Round half away from zero to a number of decimal places
 */
inline double round_to(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

inline double clamp(double value, double lo, double hi) {
    return std::min(hi, std::max(lo, value));
}

/**
 * @brief Sign as -1, 0 or +1 (NaN maps to 0)
 */
inline double sign(double value) {
    return static_cast<double>((value > 0.0) - (value < 0.0));
}

/**
 * @brief Format a fraction as a percentage with two decimals ("12.34%")
 */
inline std::string format_percent(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return ss.str();
}

inline std::string format_fixed(double value, int decimals) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(decimals) << value;
    return ss.str();
}

}  // namespace core
}  // namespace riskgate
