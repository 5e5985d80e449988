// include/riskgate/core/types.hpp

#pragma once

#include <chrono>
#include <string>

namespace riskgate {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

using Price = double;

/**
 * @brief Quantity in base-asset units, fractional allowed
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side side) {
    return side == Side::BUY ? "buy" : "sell";
}

/**
 * @brief OHLCV bar, one row of the history fed to the regime detector
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v) {}
};

}  // namespace riskgate
