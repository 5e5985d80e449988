#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "riskgate/core/config_base.hpp"
#include "riskgate/core/error.hpp"
#include "riskgate/core/types.hpp"
#include "riskgate/statistics/return_tracker.hpp"

namespace riskgate {

/**
 * @brief Portfolio-wide risk limits, fixed for the lifetime of a RiskManager
 */
struct RiskLimits : public ConfigBase {
    double max_portfolio_drawdown{0.15};  // Drawdown from peak that halts trading
    double max_single_trade_risk{0.02};   // Equity fraction risked per trade
    double max_daily_loss{0.05};          // Intraday loss that halts trading
    int max_open_positions{10};
    double max_position_size_pct{0.20};  // Max equity fraction in one position
    double max_correlation{0.70};        // Max |corr| between open positions
    double min_risk_reward{1.5};         // Not enforced by the trade gate
    double max_leverage{1.0};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Why trading is halted; decides which halts reset_daily() may clear
 */
enum class HaltOrigin {
    NONE,
    DRAWDOWN,
    DAILY_LOSS,
    MANUAL
};

std::string halt_origin_to_string(HaltOrigin origin);

/**
 * @brief Open position tracked for gating, correlation and VaR
 */
struct OpenPosition {
    std::string symbol;
    Side side{Side::BUY};
    Quantity size{0.0};
    Price entry_price{0.0};
    Timestamp entry_time;
    double value{0.0};  // size * entry_price at registration
};

/**
 * @brief Mutable portfolio state owned by one RiskManager
 */
struct PortfolioState {
    double total_equity{10000.0};
    double peak_equity{10000.0};
    double daily_start_equity{10000.0};
    std::map<std::string, OpenPosition> open_positions;  // one entry per symbol
    double daily_pnl{0.0};
    double total_pnl{0.0};
    bool is_halted{false};
    std::string halt_reason;
    HaltOrigin halt_origin{HaltOrigin::NONE};
    std::optional<Timestamp> last_update;
};

/**
 * @brief Outcome of the pre-trade gate; a rejection is a normal result
 */
struct TradeDecision {
    bool approved{false};
    std::string reason;
};

struct RiskStatus {
    double equity{0.0};
    double peak_equity{0.0};
    double drawdown{0.0};
    double daily_pnl{0.0};
    double total_pnl{0.0};
    size_t open_positions{0};
    bool is_halted{false};
    std::string halt_reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Pair of open positions whose |correlation| exceeds the limit
 */
struct CorrelatedPair {
    std::string first;
    std::string second;
    double correlation{0.0};  // |corr| rounded to 3 decimals
};

/**
 * @brief Aggregate portfolio health snapshot
 */
struct HeatCheckResult {
    bool healthy{true};
    std::vector<std::string> issues;
    double drawdown{0.0};
    double daily_pnl{0.0};
    size_t open_positions{0};
    double max_correlation{0.0};
    std::vector<CorrelatedPair> high_corr_pairs;
    double max_concentration{0.0};
    std::map<std::string, double> position_weights;
    double var_95{0.0};
    double var_99{0.0};
    double cvar_95{0.0};
    double cvar_99{0.0};
    bool is_halted{false};

    nlohmann::json to_json() const;
};

/**
 * @brief Gates every trade decision for one portfolio
 *
 * Owns the portfolio state and enforces drawdown, daily-loss, sizing,
 * concentration and correlation limits. Not internally synchronized:
 * callers serialize mutating calls per portfolio.
 */
class RiskManager {
public:
    /**
     * @param limits Risk limits, immutable afterwards
     * @param return_tracker Shared price history; a private one is created when null
     */
    explicit RiskManager(RiskLimits limits = RiskLimits(),
                         std::shared_ptr<statistics::ReturnTracker> return_tracker = nullptr);

    /**
     * @brief Mark equity to market and enforce the drawdown and daily-loss halts
     *
     * An active manual or drawdown halt keeps its origin and reason; a
     * daily-loss halt is upgraded by a drawdown breach.
     *
     * @return false if trading is halted by a breach on this update
     */
    bool update_equity(double current_equity);

    /**
     * @brief Start a new trading day; clears daily-loss halts only
     */
    void reset_daily();

    /**
     * @brief Kill switch; stays in force until resume_trading()
     */
    void halt_trading(const std::string& reason);

    /**
     * @brief Clear any halt regardless of origin
     */
    void resume_trading();

    /**
     * @brief Risk-based position size in base-asset units
     *
     * size = equity * risk_pct / |entry - stop|, capped at
     * equity * max_position_size_pct / entry, then scaled by the regime modifier.
     *
     * @param risk_per_trade Equity fraction to risk, defaults to max_single_trade_risk
     * @param regime_modifier Multiplier applied after the cap, defaults to 1
     * @return 0 when entry equals stop or entry is not positive
     */
    double calculate_position_size(double entry_price, double stop_loss_price,
                                   std::optional<double> risk_per_trade = std::nullopt,
                                   std::optional<double> regime_modifier = std::nullopt) const;

    /**
     * @brief Pre-trade gate, checks run in a fixed order and stop at the
     * first failure: halt, position count, duplicate symbol, position size,
     * stop width, correlation
     */
    TradeDecision check_new_trade(const std::string& symbol, Side side, Quantity size,
                                  Price entry_price,
                                  std::optional<Price> stop_loss_price = std::nullopt) const;

    /**
     * @brief Track an executed trade; replaces an existing entry for the symbol
     */
    void register_trade(const std::string& symbol, Side side, Quantity size, Price entry_price);

    /**
     * @brief Close a tracked position
     * @return Realized PnL, 0 if the symbol has no open position
     */
    double close_trade(const std::string& symbol, Price exit_price);

    RiskStatus get_status() const;

    /**
     * @brief Portfolio VaR of the open positions, weights = value / equity
     */
    statistics::VaRResult get_var(
        statistics::VaRMethod method = statistics::VaRMethod::PARAMETRIC) const;

    HeatCheckResult portfolio_heat_check() const;

    const RiskLimits& get_limits() const {
        return limits_;
    }

    const PortfolioState& get_state() const {
        return state_;
    }

    statistics::ReturnTracker& return_tracker() {
        return *return_tracker_;
    }

    const statistics::ReturnTracker& return_tracker() const {
        return *return_tracker_;
    }

private:
    void halt(HaltOrigin origin, const std::string& reason);

    /**
     * @brief Reject when the new symbol correlates too strongly with a held one
     */
    TradeDecision check_correlation(const std::string& symbol) const;

    double current_drawdown() const;

    const RiskLimits limits_;
    PortfolioState state_;
    std::shared_ptr<statistics::ReturnTracker> return_tracker_;
};

}  // namespace riskgate
