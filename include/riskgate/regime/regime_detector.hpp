// include/riskgate/regime/regime_detector.hpp
#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>
#include "riskgate/core/error.hpp"
#include "riskgate/core/types.hpp"
#include "riskgate/regime/regime_types.hpp"

namespace riskgate {

/**
 * @brief Per-bar sub-indicators feeding the classifier, NaN during warm-up
 */
struct RegimeIndicators {
    std::vector<Timestamp> timestamps;
    std::vector<double> adx_value;
    std::vector<double> bb_width_percentile;
    std::vector<double> ema_slope;
    std::vector<double> trend_alignment;
    std::vector<double> price_structure_score;

    size_t size() const {
        return timestamps.size();
    }
};

/**
 * @brief Score of every regime for one bar; UNKNOWN always scores 0
 */
struct RegimeScores {
    std::array<double, kRegimeCount> values{};

    double operator[](Regime regime) const {
        return values[regime_index(regime)];
    }
};

struct RegimeClassification {
    Regime regime{Regime::UNKNOWN};
    double confidence{0.0};
};

/**
 * @brief One row of detect_series
 */
struct RegimeSeriesPoint {
    Timestamp timestamp;
    double adx_value{0.0};
    double bb_width_percentile{0.0};
    double ema_slope{0.0};
    double trend_alignment{0.0};
    double price_structure_score{0.0};
    Regime raw_regime{Regime::UNKNOWN};  // Classification of this bar alone
    Regime regime{Regime::UNKNOWN};      // After hysteresis
    double confidence{0.0};
};

/**
 * @brief Classifies OHLCV history into one of the market regimes
 *
 * Five sub-indicators (ADX, Bollinger width percentile, EMA slope, EMA
 * alignment, price structure) are blended into one score per regime; the
 * best score wins. Stateless between calls.
 */
class RegimeDetector {
public:
    /**
     * @throws RiskGateError CONFIG_ERROR if the configuration is inconsistent
     */
    explicit RegimeDetector(RegimeConfig config = RegimeConfig());

    /**
     * @brief Classify the last bar of the history
     *
     * Transition probabilities come from the per-bar classification of the
     * same history.
     *
     * @param bars OHLCV history, strictly increasing timestamps
     * @return Error INVALID_DATA for empty, unordered or non-finite input
     */
    Result<RegimeState> detect(const std::vector<Bar>& bars) const;

    /**
     * @brief Classify every bar, holding a regime until `hysteresis_bars`
     * consecutive bars agree on a new one
     */
    Result<std::vector<RegimeSeriesPoint>> detect_series(const std::vector<Bar>& bars) const;

    Result<RegimeIndicators> compute_indicators(const std::vector<Bar>& bars) const;

    RegimeScores compute_regime_scores(double adx_val, double bb_pct, double slope,
                                       double alignment, double structure) const;

    /**
     * @brief Winner of the scoring with confidence
     * clamp(0.6 * best + 2 * (best - runner_up) + 0.2, 0.3, 1)
     */
    RegimeClassification classify_regime(double adx_val, double bb_pct, double slope,
                                         double alignment, double structure) const;

    const RegimeConfig& get_config() const {
        return config_;
    }

private:
    Result<void> validate_bars(const std::vector<Bar>& bars) const;

    /**
     * @brief Raw classification of every bar, UNKNOWN during warm-up
     */
    std::vector<RegimeClassification> classify_rows(const RegimeIndicators& indicators) const;

    std::map<std::string, double> transition_probabilities(
        const std::vector<RegimeClassification>& rows) const;

    RegimeConfig config_;
};

}  // namespace riskgate
