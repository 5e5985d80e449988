// include/riskgate/statistics/return_tracker.hpp
#pragma once

#include <Eigen/Dense>
#include <deque>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>
#include "riskgate/core/error.hpp"
#include "riskgate/core/types.hpp"

namespace riskgate {
namespace statistics {

enum class VaRMethod {
    PARAMETRIC,  // Gaussian on the portfolio return series
    HISTORICAL   // Empirical quantile of the portfolio return series
};

std::string var_method_to_string(VaRMethod method);

/**
 * @brief Value-at-Risk / Expected Shortfall in currency units
 *
 * All-zero with window_days == 0 means no symbol had enough history.
 */
struct VaRResult {
    double var_95{0.0};
    double var_99{0.0};
    double cvar_95{0.0};
    double cvar_99{0.0};
    VaRMethod method{VaRMethod::PARAMETRIC};
    int window_days{0};  // Aligned return observations used

    nlohmann::json to_json() const;
};

/**
 * @brief Pearson correlation matrix labelled by symbol
 *
 * Symmetric with a unit diagonal; empty when fewer than two symbols
 * carry enough history.
 */
struct CorrelationMatrix {
    std::vector<std::string> symbols;
    Eigen::MatrixXd values;

    bool empty() const {
        return symbols.empty();
    }

    size_t size() const {
        return symbols.size();
    }

    bool contains(const std::string& symbol) const;

    /**
     * @brief Correlation between two labelled symbols
     * @return Error INVALID_ARGUMENT if either symbol is absent
     */
    Result<double> correlation(const std::string& a, const std::string& b) const;

    nlohmann::json to_json() const;

private:
    long index_of(const std::string& symbol) const;
};

/**
 * @brief Rolling per-symbol price and simple-return history
 *
 * Feeds the correlation gate and the portfolio VaR of the risk manager.
 * Not internally synchronized; one writer at a time.
 */
class ReturnTracker {
public:
    static constexpr size_t kMinObservations = 20;

    /**
     * @param max_history Returns kept per symbol (prices keep one more)
     * @throws RiskGateError if max_history is zero
     */
    explicit ReturnTracker(size_t max_history = 252);

    /**
     * @brief Append a price and, from the second price on, its simple return
     * @return Error INVALID_ARGUMENT for non-finite or non-positive prices
     */
    Result<void> record_price(const std::string& symbol, Price price);

    /**
     * @brief Stored returns oldest first, empty for unknown symbols
     */
    std::vector<double> get_returns(const std::string& symbol) const;

    /**
     * @brief Correlation over every symbol with enough history
     */
    CorrelationMatrix get_correlation_matrix() const;

    /**
     * @brief Correlation over the given symbols that have enough history
     */
    CorrelationMatrix get_correlation_matrix(const std::vector<std::string>& symbols) const;

    /**
     * @brief Portfolio VaR and CVaR at 95% and 99%
     * @param symbols_weights symbol -> position_value / portfolio_value
     * @param portfolio_value Portfolio value in quote currency
     * @param method Parametric (Gaussian) or historical
     */
    VaRResult compute_var(const std::unordered_map<std::string, double>& symbols_weights,
                          double portfolio_value,
                          VaRMethod method = VaRMethod::PARAMETRIC) const;

    /**
     * @brief Symbols with any recorded price, first-seen order
     */
    const std::vector<std::string>& tracked_symbols() const {
        return symbol_order_;
    }

    size_t history_size(const std::string& symbol) const;

    size_t max_history() const {
        return max_history_;
    }

private:
    struct SymbolHistory {
        std::deque<double> prices;
        std::deque<double> returns;
    };

    std::vector<std::string> qualifying(const std::vector<std::string>& candidates) const;

    /**
     * @brief Trailing returns of each symbol trimmed to the shortest history,
     * one column per symbol
     */
    Eigen::MatrixXd aligned_returns(const std::vector<std::string>& symbols) const;

    size_t max_history_;
    std::unordered_map<std::string, SymbolHistory> history_;
    std::vector<std::string> symbol_order_;
};

}  // namespace statistics
}  // namespace riskgate
