#include "riskgate/regime/regime_types.hpp"
#include <algorithm>
#include "riskgate/core/math_utils.hpp"

namespace riskgate {

namespace {

const std::array<const char*, kRegimeCount> kRegimeNames = {
    "strong_trend_up", "weak_trend_up",  "ranging", "weak_trend_down",
    "strong_trend_down", "high_volatility", "unknown"};

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw RiskGateError(ErrorCode::CONFIG_ERROR,
                            std::string(name) + " must be positive, got " + std::to_string(value),
                            "RegimeConfig");
    }
}

}  // namespace

std::string regime_to_string(Regime regime) {
    size_t idx = regime_index(regime);
    return idx < kRegimeNames.size() ? kRegimeNames[idx] : "unknown";
}

std::optional<Regime> regime_from_string(const std::string& name) {
    for (size_t i = 0; i < kRegimeNames.size(); ++i) {
        if (name == kRegimeNames[i]) {
            return static_cast<Regime>(i);
        }
    }
    return std::nullopt;
}

nlohmann::json RegimeConfig::to_json() const {
    nlohmann::json j;
    j["adx_strong"] = adx_strong;
    j["adx_weak"] = adx_weak;
    j["bb_high_vol_pct"] = bb_high_vol_pct;
    j["ema_slope_period"] = ema_slope_period;
    j["ema_slope_lookback"] = ema_slope_lookback;
    j["alignment_ema_periods"] = alignment_ema_periods;
    j["structure_lookback"] = structure_lookback;
    j["strong_alignment_threshold"] = strong_alignment_threshold;
    j["strong_structure_threshold"] = strong_structure_threshold;
    j["transition_lookback"] = transition_lookback;
    j["bb_period"] = bb_period;
    j["bb_std"] = bb_std;
    j["adx_period"] = adx_period;
    j["hysteresis_bars"] = hysteresis_bars;
    return j;
}

void RegimeConfig::from_json(const nlohmann::json& j) {
    if (j.contains("adx_strong"))
        adx_strong = j.at("adx_strong").get<double>();
    if (j.contains("adx_weak"))
        adx_weak = j.at("adx_weak").get<double>();
    if (j.contains("bb_high_vol_pct"))
        bb_high_vol_pct = j.at("bb_high_vol_pct").get<double>();
    if (j.contains("ema_slope_period"))
        ema_slope_period = j.at("ema_slope_period").get<int>();
    if (j.contains("ema_slope_lookback"))
        ema_slope_lookback = j.at("ema_slope_lookback").get<int>();
    if (j.contains("alignment_ema_periods"))
        alignment_ema_periods = j.at("alignment_ema_periods").get<std::vector<int>>();
    if (j.contains("structure_lookback"))
        structure_lookback = j.at("structure_lookback").get<int>();
    if (j.contains("strong_alignment_threshold"))
        strong_alignment_threshold = j.at("strong_alignment_threshold").get<double>();
    if (j.contains("strong_structure_threshold"))
        strong_structure_threshold = j.at("strong_structure_threshold").get<double>();
    if (j.contains("transition_lookback"))
        transition_lookback = j.at("transition_lookback").get<int>();
    if (j.contains("bb_period"))
        bb_period = j.at("bb_period").get<int>();
    if (j.contains("bb_std"))
        bb_std = j.at("bb_std").get<double>();
    if (j.contains("adx_period"))
        adx_period = j.at("adx_period").get<int>();
    if (j.contains("hysteresis_bars"))
        hysteresis_bars = j.at("hysteresis_bars").get<int>();
    validate();
}

void RegimeConfig::validate() const {
    if (adx_weak >= adx_strong) {
        throw RiskGateError(ErrorCode::CONFIG_ERROR, "adx_weak must be below adx_strong",
                            "RegimeConfig");
    }
    require_positive(ema_slope_period, "ema_slope_period");
    require_positive(ema_slope_lookback, "ema_slope_lookback");
    require_positive(structure_lookback, "structure_lookback");
    require_positive(transition_lookback, "transition_lookback");
    require_positive(bb_period, "bb_period");
    require_positive(adx_period, "adx_period");
    require_positive(hysteresis_bars, "hysteresis_bars");
    for (int period : alignment_ema_periods) {
        require_positive(period, "alignment_ema_periods entry");
    }
}

nlohmann::json RegimeState::to_json() const {
    nlohmann::json j;
    j["regime"] = regime_to_string(regime);
    j["confidence"] = core::round_to(confidence, 3);
    j["adx_value"] = core::round_to(adx_value, 2);
    j["bb_width_percentile"] = core::round_to(bb_width_percentile, 2);
    j["ema_slope"] = core::round_to(ema_slope, 6);
    j["trend_alignment"] = core::round_to(trend_alignment, 3);
    j["price_structure_score"] = core::round_to(price_structure_score, 3);
    j["transition_probabilities"] = transition_probabilities;
    return j;
}

}  // namespace riskgate
