// include/riskgate/regime/strategy_router.hpp
#pragma once

#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "riskgate/core/config_base.hpp"
#include "riskgate/regime/regime_types.hpp"

namespace riskgate {

namespace strategies {
constexpr const char* kTrendFollowing = "CryptoInvestorV1";
constexpr const char* kMeanReversion = "BollingerMeanReversion";
constexpr const char* kBreakout = "VolatilityBreakout";
}  // namespace strategies

/**
 * @brief Share of capital and size multiplier for one strategy
 */
struct StrategyWeight {
    std::string strategy_name;
    double weight{0.0};                // Weights within an entry sum to 1
    double position_size_factor{1.0};  // Multiplier on base position size

    nlohmann::json to_json() const;
};

/**
 * @brief Allocation the router applies for one regime
 */
struct RoutingEntry {
    std::string primary;
    std::vector<StrategyWeight> weights;
    double position_modifier{1.0};
    std::string reasoning;

    nlohmann::json to_json() const;
};

/**
 * @brief Routing entries indexed by regime; a missing entry routes as RANGING
 */
using RoutingTable = std::array<std::optional<RoutingEntry>, kRegimeCount>;

/**
 * @brief Default regime to strategy mapping
 */
RoutingTable default_routing_table();

struct RoutingDecision {
    Regime regime{Regime::UNKNOWN};
    double confidence{0.0};
    std::string primary_strategy;
    std::vector<StrategyWeight> weights;
    double position_size_modifier{1.0};  // (0, 1], rounded to 3 decimals
    std::string reasoning;

    nlohmann::json to_json() const;
};

struct RouterConfig : public ConfigBase {
    double low_confidence_threshold{0.4};
    double low_confidence_penalty{0.5};
    std::optional<RoutingTable> routing_table;  // std::nullopt selects the default table

    nlohmann::json to_json() const override;

    /**
     * @brief Load thresholds and an optional "routing_table" object keyed by regime name
     * @throws RiskGateError CONFIG_ERROR for unknown regime names
     */
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Maps a regime state to a weighted strategy allocation
 *
 * Pure function of the state: the router holds only its immutable table
 * and thresholds.
 */
class StrategyRouter {
public:
    /**
     * @throws RiskGateError CONFIG_ERROR if the routing table lacks a RANGING
     * entry, has weights not summing to 1 or a modifier outside (0, 1]
     */
    explicit StrategyRouter(RouterConfig config = RouterConfig());

    /**
     * @brief Routing decision for a detected regime
     *
     * Bearish high volatility (trend_alignment < 0) is routed defensively to
     * mean reversion at half size. Confidence below the threshold scales the
     * position modifier by the penalty.
     */
    RoutingDecision route(const RegimeState& state) const;

    /**
     * @brief New decision when the running strategy no longer fits the regime
     * @return std::nullopt if the strategy is the primary or holds at least
     * half of the blend
     */
    std::optional<RoutingDecision> suggest_strategy_switch(const std::string& current_strategy,
                                                           const RegimeState& state) const;

    /**
     * @brief Sorted unique strategy names across the routing table
     */
    std::vector<std::string> get_all_strategies() const;

    const RoutingTable& get_routing_table() const {
        return table_;
    }

    /**
     * @brief Routing table keyed by regime name, for display
     */
    nlohmann::json routing_table_to_json() const;

    double low_confidence_threshold() const {
        return low_confidence_threshold_;
    }

    double low_confidence_penalty() const {
        return low_confidence_penalty_;
    }

private:
    void validate_table() const;

    RoutingTable table_;
    double low_confidence_threshold_;
    double low_confidence_penalty_;
};

}  // namespace riskgate
