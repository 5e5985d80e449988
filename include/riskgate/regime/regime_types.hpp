// include/riskgate/regime/regime_types.hpp
#pragma once

#include <array>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "riskgate/core/config_base.hpp"

namespace riskgate {

/**
 * @brief Discrete market regime
 *
 * UNKNOWN is only produced while indicators are still warming up; it never
 * wins the scoring.
 */
enum class Regime {
    STRONG_TREND_UP = 0,
    WEAK_TREND_UP,
    RANGING,
    WEAK_TREND_DOWN,
    STRONG_TREND_DOWN,
    HIGH_VOLATILITY,
    UNKNOWN
};

constexpr size_t kRegimeCount = 7;

/**
 * @brief The six regimes the scoring path can produce, in tie-break order
 */
constexpr std::array<Regime, 6> kScoredRegimes = {
    Regime::STRONG_TREND_UP,   Regime::WEAK_TREND_UP,     Regime::RANGING,
    Regime::WEAK_TREND_DOWN,   Regime::STRONG_TREND_DOWN, Regime::HIGH_VOLATILITY};

constexpr size_t regime_index(Regime regime) {
    return static_cast<size_t>(regime);
}

std::string regime_to_string(Regime regime);

/**
 * @brief Parse a regime name such as "weak_trend_up"
 * @return std::nullopt for unknown names
 */
std::optional<Regime> regime_from_string(const std::string& name);

/**
 * @brief Thresholds and lookbacks of the regime classifier
 */
struct RegimeConfig : public ConfigBase {
    double adx_strong{40.0};
    double adx_weak{25.0};
    double bb_high_vol_pct{80.0};
    int ema_slope_period{20};
    int ema_slope_lookback{5};
    std::vector<int> alignment_ema_periods{21, 50, 100, 200};
    int structure_lookback{20};
    double strong_alignment_threshold{0.5};
    double strong_structure_threshold{0.3};
    int transition_lookback{50};
    int bb_period{20};
    double bb_std{2.0};
    int adx_period{14};
    int hysteresis_bars{3};

    nlohmann::json to_json() const override;

    /**
     * @throws RiskGateError CONFIG_ERROR for non-positive periods or adx_weak >= adx_strong
     */
    void from_json(const nlohmann::json& j) override;

    /**
     * @throws RiskGateError CONFIG_ERROR when the thresholds are inconsistent
     */
    void validate() const;
};

/**
 * @brief Regime classification at one point in time
 */
struct RegimeState {
    Regime regime{Regime::UNKNOWN};
    double confidence{0.0};  // [0.3, 1] when scored, 0 during warm-up
    double adx_value{0.0};
    double bb_width_percentile{0.0};
    double ema_slope{0.0};
    double trend_alignment{0.0};        // -1 bearish .. +1 bullish
    double price_structure_score{0.0};  // -1 .. +1
    std::map<std::string, double> transition_probabilities;  // next regime -> probability

    nlohmann::json to_json() const;
};

}  // namespace riskgate
