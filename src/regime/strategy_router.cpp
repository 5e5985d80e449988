// src/regime/strategy_router.cpp

#include "riskgate/regime/strategy_router.hpp"
#include <cmath>
#include <set>
#include "riskgate/core/logger.hpp"
#include "riskgate/core/math_utils.hpp"

namespace riskgate {

namespace {

constexpr double kWeightSumTolerance = 0.01;

RoutingEntry make_entry(const std::string& primary, std::vector<StrategyWeight> weights,
                        double modifier, const std::string& reasoning) {
    RoutingEntry entry;
    entry.primary = primary;
    entry.weights = std::move(weights);
    entry.position_modifier = modifier;
    entry.reasoning = reasoning;
    return entry;
}

const RoutingEntry& bearish_high_volatility_entry() {
    static const RoutingEntry entry =
        make_entry(strategies::kMeanReversion, {{strategies::kMeanReversion, 1.0, 0.5}}, 0.5,
                   "High volatility + bearish alignment: defensive BMR at 50%");
    return entry;
}

RoutingEntry entry_from_json(const nlohmann::json& j) {
    RoutingEntry entry;
    entry.primary = j.at("primary").get<std::string>();
    for (const auto& w : j.at("weights")) {
        StrategyWeight weight;
        weight.strategy_name = w.at("strategy").get<std::string>();
        weight.weight = w.at("weight").get<double>();
        weight.position_size_factor = w.value("position_size_factor", 1.0);
        entry.weights.push_back(std::move(weight));
    }
    entry.position_modifier = j.at("position_modifier").get<double>();
    entry.reasoning = j.value("reasoning", std::string());
    return entry;
}

}  // namespace

nlohmann::json StrategyWeight::to_json() const {
    return nlohmann::json{{"strategy", strategy_name},
                          {"weight", weight},
                          {"position_size_factor", position_size_factor}};
}

nlohmann::json RoutingEntry::to_json() const {
    nlohmann::json j;
    j["primary"] = primary;
    j["weights"] = nlohmann::json::array();
    for (const auto& w : weights) {
        j["weights"].push_back(w.to_json());
    }
    j["position_modifier"] = position_modifier;
    j["reasoning"] = reasoning;
    return j;
}

RoutingTable default_routing_table() {
    using namespace strategies;
    RoutingTable table;
    table[regime_index(Regime::STRONG_TREND_UP)] = make_entry(
        kTrendFollowing, {{kTrendFollowing, 1.0, 1.0}}, 1.0,
        "Strong uptrend favors trend-following with full position sizing");
    table[regime_index(Regime::WEAK_TREND_UP)] = make_entry(
        kTrendFollowing, {{kTrendFollowing, 0.7, 0.8}, {kBreakout, 0.3, 0.6}}, 0.8,
        "Weak uptrend: primary trend-following, secondary breakout at reduced size");
    table[regime_index(Regime::RANGING)] =
        make_entry(kMeanReversion, {{kMeanReversion, 1.0, 1.0}}, 1.0,
                   "Ranging market is ideal for mean-reversion with full sizing");
    table[regime_index(Regime::WEAK_TREND_DOWN)] = make_entry(
        kMeanReversion, {{kMeanReversion, 0.5, 0.5}, {kBreakout, 0.5, 0.5}}, 0.5,
        "Weak downtrend: split between mean-reversion and breakout at half size");
    table[regime_index(Regime::STRONG_TREND_DOWN)] =
        make_entry(kMeanReversion, {{kMeanReversion, 1.0, 0.3}}, 0.3,
                   "Strong downtrend: defensive, mean-reversion only at 30% size");
    table[regime_index(Regime::HIGH_VOLATILITY)] =
        make_entry(kBreakout, {{kBreakout, 1.0, 0.8}}, 0.8,
                   "High volatility: breakout strategy at 80% size to manage risk");
    table[regime_index(Regime::UNKNOWN)] = make_entry(
        kMeanReversion, {{kMeanReversion, 1.0, 0.3}}, 0.3,
        "Unknown regime (warmup/insufficient data): conservative at 30% size");
    return table;
}

nlohmann::json RoutingDecision::to_json() const {
    nlohmann::json j;
    j["regime"] = regime_to_string(regime);
    j["confidence"] = core::round_to(confidence, 3);
    j["primary_strategy"] = primary_strategy;
    j["weights"] = nlohmann::json::array();
    for (const auto& w : weights) {
        j["weights"].push_back(w.to_json());
    }
    j["position_size_modifier"] = position_size_modifier;
    j["reasoning"] = reasoning;
    return j;
}

nlohmann::json RouterConfig::to_json() const {
    nlohmann::json j;
    j["low_confidence_threshold"] = low_confidence_threshold;
    j["low_confidence_penalty"] = low_confidence_penalty;
    if (routing_table) {
        nlohmann::json table = nlohmann::json::object();
        for (size_t i = 0; i < kRegimeCount; ++i) {
            const auto& entry = (*routing_table)[i];
            if (entry) {
                table[regime_to_string(static_cast<Regime>(i))] = entry->to_json();
            }
        }
        j["routing_table"] = table;
    }
    return j;
}

void RouterConfig::from_json(const nlohmann::json& j) {
    if (j.contains("low_confidence_threshold"))
        low_confidence_threshold = j.at("low_confidence_threshold").get<double>();
    if (j.contains("low_confidence_penalty"))
        low_confidence_penalty = j.at("low_confidence_penalty").get<double>();
    if (j.contains("routing_table")) {
        RoutingTable table;
        const auto& table_json = j.at("routing_table");
        for (auto it = table_json.begin(); it != table_json.end(); ++it) {
            const std::string name = it.key();
            auto regime = regime_from_string(name);
            if (!regime) {
                throw RiskGateError(ErrorCode::CONFIG_ERROR,
                                    "Unknown regime in routing table: " + name, "RouterConfig");
            }
            table[regime_index(*regime)] = entry_from_json(it.value());
        }
        routing_table = std::move(table);
    }
}

StrategyRouter::StrategyRouter(RouterConfig config)
    : table_(config.routing_table ? std::move(*config.routing_table) : default_routing_table()),
      low_confidence_threshold_(config.low_confidence_threshold),
      low_confidence_penalty_(config.low_confidence_penalty) {
    validate_table();
    if (low_confidence_penalty_ <= 0.0 || low_confidence_penalty_ > 1.0) {
        throw RiskGateError(ErrorCode::CONFIG_ERROR,
                            "low_confidence_penalty must be in (0, 1]", "StrategyRouter");
    }
}

void StrategyRouter::validate_table() const {
    if (!table_[regime_index(Regime::RANGING)]) {
        throw RiskGateError(ErrorCode::CONFIG_ERROR, "Routing table has no ranging entry",
                            "StrategyRouter");
    }
    for (size_t i = 0; i < kRegimeCount; ++i) {
        const auto& entry = table_[i];
        if (!entry) {
            continue;
        }
        const std::string name = regime_to_string(static_cast<Regime>(i));
        if (entry->weights.empty()) {
            throw RiskGateError(ErrorCode::CONFIG_ERROR,
                                "Routing entry " + name + " has no strategy weights",
                                "StrategyRouter");
        }
        double total = 0.0;
        for (const auto& w : entry->weights) {
            total += w.weight;
        }
        if (std::abs(total - 1.0) > kWeightSumTolerance) {
            throw RiskGateError(ErrorCode::CONFIG_ERROR,
                                "Routing entry " + name + " weights sum to " +
                                    core::format_fixed(total, 3),
                                "StrategyRouter");
        }
        if (entry->position_modifier <= 0.0 || entry->position_modifier > 1.0) {
            throw RiskGateError(ErrorCode::CONFIG_ERROR,
                                "Routing entry " + name + " position modifier outside (0, 1]",
                                "StrategyRouter");
        }
    }
}

RoutingDecision StrategyRouter::route(const RegimeState& state) const {
    const auto& slot = table_[regime_index(state.regime)];
    const RoutingEntry* entry = slot ? &*slot : &*table_[regime_index(Regime::RANGING)];

    if (state.regime == Regime::HIGH_VOLATILITY && state.trend_alignment < 0.0) {
        entry = &bearish_high_volatility_entry();
    }

    double modifier = entry->position_modifier;
    if (state.confidence < low_confidence_threshold_) {
        modifier *= low_confidence_penalty_;
    }

    RoutingDecision decision;
    decision.regime = state.regime;
    decision.confidence = state.confidence;
    decision.primary_strategy = entry->primary;
    decision.weights = entry->weights;
    decision.position_size_modifier = core::round_to(modifier, 3);
    decision.reasoning = entry->reasoning;

    DEBUG("StrategyRouter: " << regime_to_string(state.regime) << " (confidence "
                             << core::format_fixed(state.confidence, 3) << ") -> "
                             << decision.primary_strategy << " x"
                             << decision.position_size_modifier);
    return decision;
}

std::optional<RoutingDecision> StrategyRouter::suggest_strategy_switch(
    const std::string& current_strategy, const RegimeState& state) const {
    RoutingDecision decision = route(state);

    if (decision.primary_strategy == current_strategy) {
        return std::nullopt;
    }
    for (const auto& w : decision.weights) {
        if (w.strategy_name == current_strategy && w.weight >= 0.5) {
            return std::nullopt;
        }
    }
    return decision;
}

std::vector<std::string> StrategyRouter::get_all_strategies() const {
    std::set<std::string> names;
    for (const auto& entry : table_) {
        if (!entry) {
            continue;
        }
        for (const auto& w : entry->weights) {
            names.insert(w.strategy_name);
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

nlohmann::json StrategyRouter::routing_table_to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (size_t i = 0; i < kRegimeCount; ++i) {
        if (table_[i]) {
            j[regime_to_string(static_cast<Regime>(i))] = table_[i]->to_json();
        }
    }
    return j;
}

}  // namespace riskgate
