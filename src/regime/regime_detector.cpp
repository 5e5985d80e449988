// src/regime/regime_detector.cpp

#include "riskgate/regime/regime_detector.hpp"
#include <algorithm>
#include <cmath>
#include "riskgate/core/logger.hpp"
#include "riskgate/core/math_utils.hpp"
#include "riskgate/regime/indicators.hpp"

namespace riskgate {

using core::clamp;

namespace {

// EMA slope (fraction per lookback) at which the directional signal saturates
constexpr double kSlopeSaturation = 0.01;
// ADX points over which the weak-trend band fades outside [adx_weak, adx_strong]
constexpr double kWeakBandFalloff = 10.0;
constexpr double kThresholdBonus = 0.05;

constexpr int kPercentileWindow = 100;
constexpr int kPercentileMinPeriods = 20;

double positive(double x) {
    return std::max(0.0, x);
}

double or_zero(double x) {
    return std::isnan(x) ? 0.0 : x;
}

}  // namespace

RegimeDetector::RegimeDetector(RegimeConfig config) : config_(std::move(config)) {
    config_.validate();
}

Result<void> RegimeDetector::validate_bars(const std::vector<Bar>& bars) const {
    if (bars.empty()) {
        return make_error<void>(ErrorCode::INVALID_DATA, "Empty bar history", "RegimeDetector");
    }
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        if (!std::isfinite(bar.high) || !std::isfinite(bar.low) || !std::isfinite(bar.close)) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Non-finite price in bar " + std::to_string(i),
                                    "RegimeDetector");
        }
        if (i > 0 && bar.timestamp <= bars[i - 1].timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Bar timestamps not strictly increasing at index " +
                                        std::to_string(i),
                                    "RegimeDetector");
        }
    }
    return Result<void>();
}

Result<RegimeIndicators> RegimeDetector::compute_indicators(const std::vector<Bar>& bars) const {
    auto valid = validate_bars(bars);
    if (valid.is_error()) {
        return make_error<RegimeIndicators>(valid.error()->code(), valid.error()->what(),
                                            "RegimeDetector");
    }

    const size_t n = bars.size();
    std::vector<double> high(n), low(n), close(n);
    RegimeIndicators out;
    out.timestamps.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        high[i] = bars[i].high;
        low[i] = bars[i].low;
        close[i] = bars[i].close;
        out.timestamps.push_back(bars[i].timestamp);
    }

    out.adx_value = indicators::adx(high, low, close, config_.adx_period);

    // Percentile over the trailing 100 bars, or the whole history when shorter
    auto width = indicators::bollinger_width(close, config_.bb_period, config_.bb_std);
    int window = std::min(kPercentileWindow, static_cast<int>(n));
    int min_periods = std::min(kPercentileMinPeriods, window);
    out.bb_width_percentile = indicators::rolling_percentile_rank(width, window, min_periods);

    auto slope_ema = indicators::ema(close, config_.ema_slope_period);
    const size_t lag = static_cast<size_t>(config_.ema_slope_lookback);
    out.ema_slope.assign(n, core::kNaN);
    for (size_t i = lag; i < n; ++i) {
        double base = slope_ema[i - lag];
        if (base != 0.0 && !std::isnan(base)) {
            out.ema_slope[i] = (slope_ema[i] - base) / base;
        }
    }

    // +1 for every fast/slow EMA pair stacked bullishly, -1 bearishly
    std::vector<int> periods = config_.alignment_ema_periods;
    std::sort(periods.begin(), periods.end());
    std::vector<std::vector<double>> emas;
    for (int period : periods) {
        emas.push_back(indicators::ema(close, period));
    }
    out.trend_alignment.assign(n, 0.0);
    size_t n_pairs = 0;
    for (size_t a = 0; a < emas.size(); ++a) {
        for (size_t b = a + 1; b < emas.size(); ++b) {
            for (size_t i = 0; i < n; ++i) {
                out.trend_alignment[i] += core::sign(emas[a][i] - emas[b][i]);
            }
            ++n_pairs;
        }
    }
    if (n_pairs > 0) {
        for (double& value : out.trend_alignment) {
            value /= static_cast<double>(n_pairs);
        }
    }

    auto rolling_high = indicators::rolling_max(close, config_.structure_lookback);
    auto rolling_low = indicators::rolling_min(close, config_.structure_lookback);
    out.price_structure_score.assign(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        double range = rolling_high[i] - rolling_low[i];
        if (range > 0.0) {
            double midpoint = 0.5 * (rolling_high[i] + rolling_low[i]);
            out.price_structure_score[i] = clamp(2.0 * (close[i] - midpoint) / range, -1.0, 1.0);
        }
    }

    return Result<RegimeIndicators>(std::move(out));
}

RegimeScores RegimeDetector::compute_regime_scores(double adx_val, double bb_pct, double slope,
                                                   double alignment, double structure) const {
    const RegimeConfig& cfg = config_;
    const double adx_range = cfg.adx_strong - cfg.adx_weak;

    const double slope_n = clamp(slope / kSlopeSaturation, -1.0, 1.0);
    const double dir_up = 0.4 * positive(alignment) + 0.3 * positive(slope_n) +
                          0.3 * positive(structure);
    const double dir_down = 0.4 * positive(-alignment) + 0.3 * positive(-slope_n) +
                            0.3 * positive(-structure);

    // 0 at half a band below adx_strong, 1 at half a band above
    const double strong_adx = clamp((adx_val - cfg.adx_strong) / adx_range + 0.5, 0.0, 1.0);
    double band_distance = 0.0;
    if (adx_val < cfg.adx_weak) {
        band_distance = cfg.adx_weak - adx_val;
    } else if (adx_val > cfg.adx_strong) {
        band_distance = adx_val - cfg.adx_strong;
    }
    const double weak_band = clamp(1.0 - band_distance / kWeakBandFalloff, 0.0, 1.0);
    // 0.5 at adx_weak, saturating half a band either side
    const double low_adx = clamp((cfg.adx_weak - adx_val) / adx_range + 0.5, 0.0, 1.0);
    const double vol_score = clamp((bb_pct - 50.0) / 50.0, 0.0, 1.0);

    auto bonus = [](bool condition) { return condition ? kThresholdBonus : 0.0; };

    RegimeScores scores;
    auto& s = scores.values;

    s[regime_index(Regime::STRONG_TREND_UP)] =
        0.4 * strong_adx + 0.5 * dir_up + bonus(adx_val > cfg.adx_strong) +
        bonus(alignment > cfg.strong_alignment_threshold) +
        bonus(structure > cfg.strong_structure_threshold && slope > 0.0);

    s[regime_index(Regime::STRONG_TREND_DOWN)] =
        0.4 * strong_adx + 0.5 * dir_down + bonus(adx_val > cfg.adx_strong) +
        bonus(alignment < -cfg.strong_alignment_threshold) +
        bonus(structure < -cfg.strong_structure_threshold && slope < 0.0);

    s[regime_index(Regime::WEAK_TREND_UP)] =
        0.35 * weak_band + 0.5 * dir_up + bonus(alignment > 0.0 && slope > 0.0);

    s[regime_index(Regime::WEAK_TREND_DOWN)] =
        0.35 * weak_band + 0.5 * dir_down + bonus(alignment < 0.0 && slope < 0.0);

    s[regime_index(Regime::HIGH_VOLATILITY)] =
        0.55 * vol_score + 0.3 * low_adx + (bb_pct > cfg.bb_high_vol_pct ? 0.15 : 0.0);

    const double quiet = 0.35 * low_adx + 0.2 * (1.0 - std::abs(slope_n)) +
                         0.2 * (1.0 - std::min(1.0, std::abs(alignment)));
    s[regime_index(Regime::RANGING)] = quiet * (1.0 - 0.5 * std::max(dir_up, dir_down));

    s[regime_index(Regime::UNKNOWN)] = 0.0;
    return scores;
}

RegimeClassification RegimeDetector::classify_regime(double adx_val, double bb_pct,
                                                     double slope, double alignment,
                                                     double structure) const {
    RegimeScores scores = compute_regime_scores(adx_val, bb_pct, slope, alignment, structure);

    Regime best = kScoredRegimes.front();
    double best_score = scores[best];
    for (Regime regime : kScoredRegimes) {
        if (scores[regime] > best_score) {
            best = regime;
            best_score = scores[regime];
        }
    }
    double second_score = -1.0;
    for (Regime regime : kScoredRegimes) {
        if (regime != best) {
            second_score = std::max(second_score, scores[regime]);
        }
    }

    double confidence = clamp(0.6 * best_score + 2.0 * (best_score - second_score) + 0.2, 0.3, 1.0);
    return {best, confidence};
}

std::vector<RegimeClassification> RegimeDetector::classify_rows(
    const RegimeIndicators& ind) const {
    std::vector<RegimeClassification> rows(ind.size());
    for (size_t i = 0; i < ind.size(); ++i) {
        if (std::isnan(ind.adx_value[i]) || std::isnan(ind.bb_width_percentile[i])) {
            continue;
        }
        rows[i] = classify_regime(ind.adx_value[i], ind.bb_width_percentile[i],
                                  or_zero(ind.ema_slope[i]), or_zero(ind.trend_alignment[i]),
                                  or_zero(ind.price_structure_score[i]));
    }
    return rows;
}

std::map<std::string, double> RegimeDetector::transition_probabilities(
    const std::vector<RegimeClassification>& rows) const {
    std::vector<Regime> classified;
    for (const auto& row : rows) {
        if (row.regime != Regime::UNKNOWN) {
            classified.push_back(row.regime);
        }
    }

    const size_t lookback = static_cast<size_t>(config_.transition_lookback);
    if (classified.size() > lookback) {
        classified.erase(classified.begin(), classified.end() - static_cast<long>(lookback));
    }
    if (classified.size() < 2) {
        return {};
    }

    const Regime current = classified.back();
    std::map<std::string, int> counts;
    int total = 0;
    for (size_t i = 0; i + 1 < classified.size(); ++i) {
        if (classified[i] == current) {
            ++counts[regime_to_string(classified[i + 1])];
            ++total;
        }
    }
    if (total == 0) {
        return {};
    }

    std::map<std::string, double> probabilities;
    for (const auto& [name, count] : counts) {
        probabilities[name] = core::round_to(static_cast<double>(count) / total, 3);
    }
    return probabilities;
}

Result<RegimeState> RegimeDetector::detect(const std::vector<Bar>& bars) const {
    auto indicators_result = compute_indicators(bars);
    if (indicators_result.is_error()) {
        return make_error<RegimeState>(indicators_result.error()->code(),
                                       indicators_result.error()->what(), "RegimeDetector");
    }
    const RegimeIndicators& ind = indicators_result.value();
    auto rows = classify_rows(ind);
    const size_t last = ind.size() - 1;

    RegimeState state;
    state.regime = rows[last].regime;
    state.confidence = rows[last].confidence;
    state.adx_value = or_zero(ind.adx_value[last]);
    state.bb_width_percentile = or_zero(ind.bb_width_percentile[last]);
    state.ema_slope = or_zero(ind.ema_slope[last]);
    state.trend_alignment = or_zero(ind.trend_alignment[last]);
    state.price_structure_score = or_zero(ind.price_structure_score[last]);
    state.transition_probabilities = transition_probabilities(rows);
    return Result<RegimeState>(std::move(state));
}

Result<std::vector<RegimeSeriesPoint>> RegimeDetector::detect_series(
    const std::vector<Bar>& bars) const {
    auto indicators_result = compute_indicators(bars);
    if (indicators_result.is_error()) {
        return make_error<std::vector<RegimeSeriesPoint>>(indicators_result.error()->code(),
                                                          indicators_result.error()->what(),
                                                          "RegimeDetector");
    }
    const RegimeIndicators& ind = indicators_result.value();
    auto rows = classify_rows(ind);

    std::vector<RegimeSeriesPoint> series(ind.size());

    Regime held = Regime::UNKNOWN;
    double held_confidence = 0.0;
    Regime candidate = Regime::UNKNOWN;
    int streak = 0;
    bool after_unknown = true;

    for (size_t i = 0; i < ind.size(); ++i) {
        RegimeSeriesPoint& point = series[i];
        point.timestamp = ind.timestamps[i];
        point.adx_value = ind.adx_value[i];
        point.bb_width_percentile = ind.bb_width_percentile[i];
        point.ema_slope = ind.ema_slope[i];
        point.trend_alignment = ind.trend_alignment[i];
        point.price_structure_score = ind.price_structure_score[i];
        point.raw_regime = rows[i].regime;

        if (rows[i].regime == Regime::UNKNOWN) {
            point.regime = Regime::UNKNOWN;
            point.confidence = 0.0;
            after_unknown = true;
            continue;
        }

        if (after_unknown || rows[i].regime == held) {
            held = rows[i].regime;
            held_confidence = rows[i].confidence;
            candidate = Regime::UNKNOWN;
            streak = 0;
            after_unknown = false;
        } else {
            if (rows[i].regime == candidate) {
                ++streak;
            } else {
                candidate = rows[i].regime;
                streak = 1;
            }
            if (streak >= config_.hysteresis_bars) {
                DEBUG("RegimeDetector: regime switch " << regime_to_string(held) << " -> "
                                                       << regime_to_string(candidate)
                                                       << " at bar " << i);
                held = candidate;
                held_confidence = rows[i].confidence;
                candidate = Regime::UNKNOWN;
                streak = 0;
            }
        }

        point.regime = held;
        point.confidence = held_confidence;
    }

    return Result<std::vector<RegimeSeriesPoint>>(std::move(series));
}

}  // namespace riskgate
