#include "riskgate/risk/risk_manager.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <unordered_map>
#include "riskgate/core/logger.hpp"
#include "riskgate/core/math_utils.hpp"

namespace riskgate {

using core::format_fixed;
using core::format_percent;

nlohmann::json RiskLimits::to_json() const {
    nlohmann::json j;
    j["max_portfolio_drawdown"] = max_portfolio_drawdown;
    j["max_single_trade_risk"] = max_single_trade_risk;
    j["max_daily_loss"] = max_daily_loss;
    j["max_open_positions"] = max_open_positions;
    j["max_position_size_pct"] = max_position_size_pct;
    j["max_correlation"] = max_correlation;
    j["min_risk_reward"] = min_risk_reward;
    j["max_leverage"] = max_leverage;
    return j;
}

void RiskLimits::from_json(const nlohmann::json& j) {
    if (j.contains("max_portfolio_drawdown"))
        max_portfolio_drawdown = j.at("max_portfolio_drawdown").get<double>();
    if (j.contains("max_single_trade_risk"))
        max_single_trade_risk = j.at("max_single_trade_risk").get<double>();
    if (j.contains("max_daily_loss"))
        max_daily_loss = j.at("max_daily_loss").get<double>();
    if (j.contains("max_open_positions"))
        max_open_positions = j.at("max_open_positions").get<int>();
    if (j.contains("max_position_size_pct"))
        max_position_size_pct = j.at("max_position_size_pct").get<double>();
    if (j.contains("max_correlation"))
        max_correlation = j.at("max_correlation").get<double>();
    if (j.contains("min_risk_reward"))
        min_risk_reward = j.at("min_risk_reward").get<double>();
    if (j.contains("max_leverage"))
        max_leverage = j.at("max_leverage").get<double>();
}

std::string halt_origin_to_string(HaltOrigin origin) {
    switch (origin) {
        case HaltOrigin::NONE:
            return "none";
        case HaltOrigin::DRAWDOWN:
            return "drawdown";
        case HaltOrigin::DAILY_LOSS:
            return "daily_loss";
        case HaltOrigin::MANUAL:
            return "manual";
    }
    return "unknown";
}

nlohmann::json RiskStatus::to_json() const {
    nlohmann::json j;
    j["equity"] = equity;
    j["peak_equity"] = peak_equity;
    j["drawdown"] = format_percent(drawdown);
    j["daily_pnl"] = daily_pnl;
    j["total_pnl"] = total_pnl;
    j["open_positions"] = open_positions;
    j["is_halted"] = is_halted;
    j["halt_reason"] = halt_reason;
    return j;
}

nlohmann::json HeatCheckResult::to_json() const {
    nlohmann::json j;
    j["healthy"] = healthy;
    j["issues"] = issues;
    j["drawdown"] = drawdown;
    j["daily_pnl"] = daily_pnl;
    j["open_positions"] = open_positions;
    j["max_correlation"] = max_correlation;
    j["high_corr_pairs"] = nlohmann::json::array();
    for (const auto& pair : high_corr_pairs) {
        j["high_corr_pairs"].push_back({pair.first, pair.second, pair.correlation});
    }
    j["max_concentration"] = max_concentration;
    j["position_weights"] = position_weights;
    j["var_95"] = var_95;
    j["var_99"] = var_99;
    j["cvar_95"] = cvar_95;
    j["cvar_99"] = cvar_99;
    j["is_halted"] = is_halted;
    return j;
}

RiskManager::RiskManager(RiskLimits limits,
                         std::shared_ptr<statistics::ReturnTracker> return_tracker)
    : limits_(std::move(limits)),
      return_tracker_(return_tracker ? std::move(return_tracker)
                                     : std::make_shared<statistics::ReturnTracker>()) {
    INFO("RiskManager initialized: " << limits_.to_json().dump());
}

double RiskManager::current_drawdown() const {
    if (state_.peak_equity <= 0.0) {
        return 0.0;
    }
    return 1.0 - state_.total_equity / state_.peak_equity;
}

void RiskManager::halt(HaltOrigin origin, const std::string& reason) {
    // Manual and drawdown halts outlive reset_daily(); a later breach must not relabel them
    if (state_.is_halted && origin != HaltOrigin::MANUAL &&
        (state_.halt_origin == HaltOrigin::MANUAL || state_.halt_origin == HaltOrigin::DRAWDOWN)) {
        DEBUG("RiskManager: already halted (" << halt_origin_to_string(state_.halt_origin)
                                              << "), ignoring " << reason);
        return;
    }
    state_.is_halted = true;
    state_.halt_reason = reason;
    state_.halt_origin = origin;
    ERROR("RiskManager: " << reason);
}

bool RiskManager::update_equity(double current_equity) {
    state_.total_equity = current_equity;
    state_.peak_equity = std::max(state_.peak_equity, current_equity);
    state_.last_update = std::chrono::system_clock::now();

    double drawdown = current_drawdown();
    if (drawdown >= limits_.max_portfolio_drawdown) {
        halt(HaltOrigin::DRAWDOWN, "Max drawdown breached: " + format_percent(drawdown) +
                                       " >= " + format_percent(limits_.max_portfolio_drawdown));
        return false;
    }

    if (state_.daily_start_equity > 0.0) {
        double daily_change =
            (current_equity - state_.daily_start_equity) / state_.daily_start_equity;
        if (daily_change <= -limits_.max_daily_loss) {
            halt(HaltOrigin::DAILY_LOSS, "Daily loss limit breached: " +
                                             format_percent(daily_change) + " <= -" +
                                             format_percent(limits_.max_daily_loss));
            return false;
        }
    }

    return true;
}

void RiskManager::reset_daily() {
    state_.daily_start_equity = state_.total_equity;
    state_.daily_pnl = 0.0;
    if (state_.is_halted && state_.halt_origin == HaltOrigin::DAILY_LOSS) {
        state_.is_halted = false;
        state_.halt_reason.clear();
        state_.halt_origin = HaltOrigin::NONE;
        INFO("RiskManager: daily halt cleared, trading resumed");
    }
}

void RiskManager::halt_trading(const std::string& reason) {
    halt(HaltOrigin::MANUAL, reason);
}

void RiskManager::resume_trading() {
    if (state_.is_halted) {
        INFO("RiskManager: trading resumed (was halted: " << state_.halt_reason << ")");
    }
    state_.is_halted = false;
    state_.halt_reason.clear();
    state_.halt_origin = HaltOrigin::NONE;
}

double RiskManager::calculate_position_size(double entry_price, double stop_loss_price,
                                            std::optional<double> risk_per_trade,
                                            std::optional<double> regime_modifier) const {
    // An unset or zero risk fraction falls back to the limit
    double risk_pct = (risk_per_trade && *risk_per_trade != 0.0) ? *risk_per_trade
                                                                 : limits_.max_single_trade_risk;
    double risk_amount = state_.total_equity * risk_pct;
    double price_risk = std::abs(entry_price - stop_loss_price);

    if (price_risk == 0.0) {
        WARN("RiskManager: stop loss equals entry price, returning 0 size");
        return 0.0;
    }
    if (entry_price <= 0.0) {
        WARN("RiskManager: non-positive entry price " << entry_price << ", returning 0 size");
        return 0.0;
    }

    double size = risk_amount / price_risk;
    double max_size = state_.total_equity * limits_.max_position_size_pct / entry_price;
    size = std::min(size, max_size);
    size *= regime_modifier.value_or(1.0);

    INFO("RiskManager: position size " << format_fixed(size, 6) << " (risk $"
                                       << format_fixed(risk_amount, 2) << ", price risk $"
                                       << format_fixed(price_risk, 2) << ", entry $"
                                       << format_fixed(entry_price, 2) << ", regime modifier "
                                       << regime_modifier.value_or(1.0) << ")");
    return size;
}

TradeDecision RiskManager::check_new_trade(const std::string& symbol, Side side, Quantity size,
                                           Price entry_price,
                                           std::optional<Price> stop_loss_price) const {
    if (state_.is_halted) {
        return {false, "Trading halted: " + state_.halt_reason};
    }

    if (static_cast<long>(state_.open_positions.size()) >= limits_.max_open_positions) {
        return {false,
                "Max open positions reached (" + std::to_string(limits_.max_open_positions) + ")"};
    }

    if (state_.open_positions.count(symbol)) {
        return {false, "Already have open position in " + symbol};
    }

    if (state_.total_equity <= 0.0) {
        return {false, "Position too large: no equity available"};
    }
    double position_pct = size * entry_price / state_.total_equity;
    if (position_pct > limits_.max_position_size_pct) {
        return {false, "Position too large: " + format_percent(position_pct) + " > " +
                           format_percent(limits_.max_position_size_pct)};
    }

    // Raw per-unit risk against twice the per-trade budget; min_risk_reward is not consulted
    if (stop_loss_price && *stop_loss_price != 0.0 && entry_price != 0.0) {
        double trade_risk = std::abs(entry_price - *stop_loss_price) / entry_price;
        if (trade_risk > limits_.max_single_trade_risk * 2.0) {
            return {false, "Stop loss too wide: " + format_percent(trade_risk) + " risk per unit"};
        }
    }

    TradeDecision correlation = check_correlation(symbol);
    if (!correlation.approved) {
        return correlation;
    }

    INFO("RiskManager: trade approved: " << side_to_string(side) << " " << format_fixed(size, 6)
                                         << " " << symbol << " @ " << entry_price);
    return {true, "approved"};
}

TradeDecision RiskManager::check_correlation(const std::string& symbol) const {
    if (state_.open_positions.empty()) {
        return {true, ""};
    }

    std::vector<std::string> symbols;
    for (const auto& [held, position] : state_.open_positions) {
        symbols.push_back(held);
    }
    symbols.push_back(symbol);

    auto corr = return_tracker_->get_correlation_matrix(symbols);
    if (corr.empty() || !corr.contains(symbol)) {
        DEBUG("RiskManager: insufficient return history for correlation check on " << symbol);
        return {true, ""};
    }

    for (const auto& [held, position] : state_.open_positions) {
        auto value = corr.correlation(symbol, held);
        if (value.is_error()) {
            continue;
        }
        double c = std::abs(value.value());
        if (c > limits_.max_correlation) {
            std::ostringstream reason;
            reason << "Correlation too high: " << symbol << " vs " << held << " = "
                   << format_fixed(c, 2) << " > " << limits_.max_correlation;
            return {false, reason.str()};
        }
    }
    return {true, ""};
}

void RiskManager::register_trade(const std::string& symbol, Side side, Quantity size,
                                 Price entry_price) {
    if (state_.open_positions.count(symbol)) {
        WARN("RiskManager: replacing existing open position in " << symbol);
    }

    OpenPosition position;
    position.symbol = symbol;
    position.side = side;
    position.size = size;
    position.entry_price = entry_price;
    position.entry_time = std::chrono::system_clock::now();
    position.value = size * entry_price;
    state_.open_positions[symbol] = position;
}

double RiskManager::close_trade(const std::string& symbol, Price exit_price) {
    auto it = state_.open_positions.find(symbol);
    if (it == state_.open_positions.end()) {
        WARN("RiskManager: no open position found for " << symbol);
        return 0.0;
    }

    const OpenPosition position = it->second;
    state_.open_positions.erase(it);

    double pnl = position.side == Side::BUY ? (exit_price - position.entry_price) * position.size
                                            : (position.entry_price - exit_price) * position.size;
    state_.daily_pnl += pnl;
    state_.total_pnl += pnl;
    INFO("RiskManager: closed " << symbol << ": PnL $" << format_fixed(pnl, 2) << " (daily: $"
                                << format_fixed(state_.daily_pnl, 2) << ")");
    return pnl;
}

RiskStatus RiskManager::get_status() const {
    RiskStatus status;
    status.equity = state_.total_equity;
    status.peak_equity = state_.peak_equity;
    status.drawdown = current_drawdown();
    status.daily_pnl = state_.daily_pnl;
    status.total_pnl = state_.total_pnl;
    status.open_positions = state_.open_positions.size();
    status.is_halted = state_.is_halted;
    status.halt_reason = state_.halt_reason;
    return status;
}

statistics::VaRResult RiskManager::get_var(statistics::VaRMethod method) const {
    if (state_.open_positions.empty() || state_.total_equity <= 0.0) {
        statistics::VaRResult empty;
        empty.method = method;
        return empty;
    }

    std::unordered_map<std::string, double> weights;
    for (const auto& [symbol, position] : state_.open_positions) {
        weights[symbol] = position.value / state_.total_equity;
    }
    return return_tracker_->compute_var(weights, state_.total_equity, method);
}

HeatCheckResult RiskManager::portfolio_heat_check() const {
    HeatCheckResult result;
    const double drawdown = current_drawdown();

    std::vector<std::string> open_symbols;
    for (const auto& [symbol, position] : state_.open_positions) {
        open_symbols.push_back(symbol);
    }

    auto corr = return_tracker_->get_correlation_matrix(open_symbols);
    double max_corr = 0.0;
    for (size_t i = 0; i < corr.size(); ++i) {
        for (size_t j = i + 1; j < corr.size(); ++j) {
            double c = std::abs(corr.values(static_cast<long>(i), static_cast<long>(j)));
            max_corr = std::max(max_corr, c);
            if (c > limits_.max_correlation) {
                result.high_corr_pairs.push_back(
                    {corr.symbols[i], corr.symbols[j], core::round_to(c, 3)});
            }
        }
    }

    statistics::VaRResult var = get_var();

    double max_concentration = 0.0;
    for (const auto& [symbol, position] : state_.open_positions) {
        double weight =
            state_.total_equity > 0.0 ? position.value / state_.total_equity : 0.0;
        result.position_weights[symbol] = core::round_to(weight, 4);
        max_concentration = std::max(max_concentration, weight);
    }

    if (state_.is_halted) {
        result.issues.push_back("HALTED: " + state_.halt_reason);
    }
    if (drawdown > limits_.max_portfolio_drawdown * 0.8) {
        result.issues.push_back("Drawdown warning: " + format_percent(drawdown) +
                                " approaching limit " +
                                format_percent(limits_.max_portfolio_drawdown));
    }
    if (!result.high_corr_pairs.empty()) {
        std::ostringstream pairs;
        pairs << "High correlation:";
        for (const auto& pair : result.high_corr_pairs) {
            pairs << " (" << pair.first << ", " << pair.second << ", "
                  << format_fixed(pair.correlation, 3) << ")";
        }
        result.issues.push_back(pairs.str());
    }
    if (max_concentration > limits_.max_position_size_pct * 0.9) {
        result.issues.push_back("Concentration warning: " + format_percent(max_concentration) +
                                " in single position");
    }
    if (var.var_99 > state_.total_equity * 0.10) {
        result.issues.push_back("VaR warning: 99% VaR $" + format_fixed(var.var_99, 0) +
                                " > 10% of equity");
    }

    result.healthy = result.issues.empty();
    result.drawdown = core::round_to(drawdown, 4);
    result.daily_pnl = state_.daily_pnl;
    result.open_positions = state_.open_positions.size();
    result.max_correlation = core::round_to(max_corr, 3);
    result.max_concentration = core::round_to(max_concentration, 4);
    result.var_95 = var.var_95;
    result.var_99 = var.var_99;
    result.cvar_95 = var.cvar_95;
    result.cvar_99 = var.cvar_99;
    result.is_halted = state_.is_halted;
    return result;
}

}  // namespace riskgate
