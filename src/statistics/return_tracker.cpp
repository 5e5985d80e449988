// src/statistics/return_tracker.cpp

#include "riskgate/statistics/return_tracker.hpp"
#include <algorithm>
#include <cmath>
#include "riskgate/core/logger.hpp"
#include "riskgate/core/math_utils.hpp"
#include "riskgate/statistics/normal_distribution.hpp"

namespace riskgate {
namespace statistics {

namespace {

constexpr double kTail95 = 0.05;
constexpr double kTail99 = 0.01;

VaRResult rounded(double var_95, double var_99, double cvar_95, double cvar_99,
                  VaRMethod method, int window_days) {
    VaRResult result;
    result.var_95 = core::round_to(var_95, 2);
    result.var_99 = core::round_to(var_99, 2);
    result.cvar_95 = core::round_to(cvar_95, 2);
    result.cvar_99 = core::round_to(cvar_99, 2);
    result.method = method;
    result.window_days = window_days;
    return result;
}

}  // namespace

std::string var_method_to_string(VaRMethod method) {
    return method == VaRMethod::HISTORICAL ? "historical" : "parametric";
}

nlohmann::json VaRResult::to_json() const {
    nlohmann::json j;
    j["var_95"] = var_95;
    j["var_99"] = var_99;
    j["cvar_95"] = cvar_95;
    j["cvar_99"] = cvar_99;
    j["method"] = var_method_to_string(method);
    j["window_days"] = window_days;
    return j;
}

// ============================================================================
// CorrelationMatrix
// ============================================================================

long CorrelationMatrix::index_of(const std::string& symbol) const {
    auto it = std::find(symbols.begin(), symbols.end(), symbol);
    return it == symbols.end() ? -1 : static_cast<long>(it - symbols.begin());
}

bool CorrelationMatrix::contains(const std::string& symbol) const {
    return index_of(symbol) >= 0;
}

Result<double> CorrelationMatrix::correlation(const std::string& a, const std::string& b) const {
    long i = index_of(a);
    long j = index_of(b);
    if (i < 0 || j < 0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Symbol not in correlation matrix: " + (i < 0 ? a : b),
                                  "CorrelationMatrix");
    }
    return Result<double>(values(i, j));
}

nlohmann::json CorrelationMatrix::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (size_t r = 0; r < symbols.size(); ++r) {
        nlohmann::json row = nlohmann::json::object();
        for (size_t c = 0; c < symbols.size(); ++c) {
            row[symbols[c]] = values(static_cast<long>(r), static_cast<long>(c));
        }
        j[symbols[r]] = row;
    }
    return j;
}

// ============================================================================
// ReturnTracker
// ============================================================================

ReturnTracker::ReturnTracker(size_t max_history) : max_history_(max_history) {
    if (max_history_ == 0) {
        throw RiskGateError(ErrorCode::CONFIG_ERROR, "max_history must be positive",
                            "ReturnTracker");
    }
}

Result<void> ReturnTracker::record_price(const std::string& symbol, Price price) {
    if (!std::isfinite(price) || price <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid price for " + symbol + ": " + std::to_string(price),
                                "ReturnTracker");
    }

    auto it = history_.find(symbol);
    if (it == history_.end()) {
        it = history_.emplace(symbol, SymbolHistory{}).first;
        symbol_order_.push_back(symbol);
    }

    auto& hist = it->second;
    hist.prices.push_back(price);
    if (hist.prices.size() > max_history_ + 1) {
        hist.prices.pop_front();
    }

    if (hist.prices.size() >= 2) {
        double prev = hist.prices[hist.prices.size() - 2];
        hist.returns.push_back((price - prev) / prev);
        if (hist.returns.size() > max_history_) {
            hist.returns.pop_front();
        }
    }
    return Result<void>();
}

std::vector<double> ReturnTracker::get_returns(const std::string& symbol) const {
    auto it = history_.find(symbol);
    if (it == history_.end()) {
        return {};
    }
    return std::vector<double>(it->second.returns.begin(), it->second.returns.end());
}

size_t ReturnTracker::history_size(const std::string& symbol) const {
    auto it = history_.find(symbol);
    return it == history_.end() ? 0 : it->second.returns.size();
}

std::vector<std::string> ReturnTracker::qualifying(
    const std::vector<std::string>& candidates) const {
    std::vector<std::string> symbols;
    for (const auto& symbol : candidates) {
        if (std::find(symbols.begin(), symbols.end(), symbol) != symbols.end()) {
            continue;
        }
        if (history_size(symbol) >= kMinObservations) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

Eigen::MatrixXd ReturnTracker::aligned_returns(const std::vector<std::string>& symbols) const {
    size_t min_len = history_.at(symbols.front()).returns.size();
    for (const auto& symbol : symbols) {
        min_len = std::min(min_len, history_.at(symbol).returns.size());
    }

    Eigen::MatrixXd matrix(static_cast<long>(min_len), static_cast<long>(symbols.size()));
    for (size_t c = 0; c < symbols.size(); ++c) {
        const auto& returns = history_.at(symbols[c]).returns;
        size_t offset = returns.size() - min_len;
        for (size_t r = 0; r < min_len; ++r) {
            matrix(static_cast<long>(r), static_cast<long>(c)) = returns[offset + r];
        }
    }
    return matrix;
}

CorrelationMatrix ReturnTracker::get_correlation_matrix() const {
    return get_correlation_matrix(symbol_order_);
}

CorrelationMatrix ReturnTracker::get_correlation_matrix(
    const std::vector<std::string>& symbols) const {
    CorrelationMatrix result;
    auto valid = qualifying(symbols);
    if (valid.size() < 2) {
        return result;
    }

    Eigen::MatrixXd returns = aligned_returns(valid);
    Eigen::MatrixXd centered = returns.rowwise() - returns.colwise().mean();
    Eigen::MatrixXd cov = centered.transpose() * centered;
    Eigen::VectorXd scale = cov.diagonal().cwiseSqrt();

    const long k = static_cast<long>(valid.size());
    Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(k, k);
    for (long i = 0; i < k; ++i) {
        for (long j = i + 1; j < k; ++j) {
            double denom = scale(i) * scale(j);
            // A flat series has no measurable co-movement
            double value = denom > 0.0 ? core::clamp(cov(i, j) / denom, -1.0, 1.0) : 0.0;
            corr(i, j) = value;
            corr(j, i) = value;
        }
    }

    result.symbols = std::move(valid);
    result.values = std::move(corr);
    return result;
}

VaRResult ReturnTracker::compute_var(
    const std::unordered_map<std::string, double>& symbols_weights, double portfolio_value,
    VaRMethod method) const {
    std::vector<std::string> candidates;
    for (const auto& symbol : symbol_order_) {
        if (symbols_weights.count(symbol)) {
            candidates.push_back(symbol);
        }
    }
    auto valid = qualifying(candidates);

    VaRResult empty;
    empty.method = method;
    if (valid.empty()) {
        DEBUG("ReturnTracker: no symbol with " << kMinObservations
                                               << " returns, VaR reported as zero");
        return empty;
    }

    Eigen::MatrixXd returns = aligned_returns(valid);
    Eigen::VectorXd weights(static_cast<long>(valid.size()));
    for (size_t i = 0; i < valid.size(); ++i) {
        weights(static_cast<long>(i)) = symbols_weights.at(valid[i]);
    }

    Eigen::VectorXd portfolio_returns = returns * weights;
    const long n = portfolio_returns.size();
    const int window = static_cast<int>(n);

    if (method == VaRMethod::HISTORICAL) {
        std::vector<double> sorted(portfolio_returns.data(), portfolio_returns.data() + n);
        std::sort(sorted.begin(), sorted.end());

        auto tail_index = [n](double p) {
            return std::max<long>(0, static_cast<long>(static_cast<double>(n) * p));
        };
        auto tail_mean = [&sorted](long idx) {
            double sum = 0.0;
            for (long i = 0; i <= idx; ++i) {
                sum += sorted[static_cast<size_t>(i)];
            }
            return sum / static_cast<double>(idx + 1);
        };

        long idx_95 = tail_index(kTail95);
        long idx_99 = tail_index(kTail99);

        double var_95 = -sorted[static_cast<size_t>(idx_95)] * portfolio_value;
        double var_99 = -sorted[static_cast<size_t>(idx_99)] * portfolio_value;
        double cvar_95 = idx_95 > 0 ? -tail_mean(idx_95) * portfolio_value : var_95;
        double cvar_99 = idx_99 > 0 ? -tail_mean(idx_99) * portfolio_value : var_99;
        return rounded(var_95, var_99, cvar_95, cvar_99, method, window);
    }

    const double mu = portfolio_returns.mean();
    // Population standard deviation
    const double sigma =
        std::sqrt((portfolio_returns.array() - mu).square().sum() / static_cast<double>(n));
    if (sigma == 0.0) {
        empty.window_days = window;
        return empty;
    }

    const double z_95 = normal::ppf(kTail95);
    const double z_99 = normal::ppf(kTail99);

    double var_95 = -(mu + z_95 * sigma) * portfolio_value;
    double var_99 = -(mu + z_99 * sigma) * portfolio_value;
    double cvar_95 = -(mu - sigma * normal::pdf(z_95) / kTail95) * portfolio_value;
    double cvar_99 = -(mu - sigma * normal::pdf(z_99) / kTail99) * portfolio_value;
    return rounded(var_95, var_99, cvar_95, cvar_99, method, window);
}

}  // namespace statistics
}  // namespace riskgate
