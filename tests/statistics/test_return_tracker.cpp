#include <gtest/gtest.h>
#include <cmath>
#include <initializer_list>
#include <vector>
#include "../core/test_base.hpp"
#include "riskgate/statistics/return_tracker.hpp"

using namespace riskgate;
using namespace riskgate::statistics;

class ReturnTrackerTest : public riskgate::testing::TestBase {
protected:
    /**
     * @brief Feed prices so that the stored returns equal `returns`
     */
    void feed_returns(ReturnTracker& tracker, const std::string& symbol,
                      const std::vector<double>& returns, double start = 100.0) {
        double price = start;
        ASSERT_TRUE(tracker.record_price(symbol, price).is_ok());
        for (double r : returns) {
            price *= 1.0 + r;
            ASSERT_TRUE(tracker.record_price(symbol, price).is_ok());
        }
    }

    static std::vector<double> wave(size_t n, double amplitude = 0.01, double phase = 0.0) {
        std::vector<double> out;
        for (size_t i = 0; i < n; ++i) {
            out.push_back(amplitude * std::sin(0.7 * static_cast<double>(i) + phase));
        }
        return out;
    }

    static std::vector<double> negated(std::vector<double> values) {
        for (double& v : values) {
            v = -v;
        }
        return values;
    }
};

TEST_F(ReturnTrackerTest, FirstPriceHasNoReturn) {
    ReturnTracker tracker;
    ASSERT_TRUE(tracker.record_price("BTC/USDT", 100.0).is_ok());
    EXPECT_TRUE(tracker.get_returns("BTC/USDT").empty());

    ASSERT_TRUE(tracker.record_price("BTC/USDT", 110.0).is_ok());
    auto returns = tracker.get_returns("BTC/USDT");
    ASSERT_EQ(returns.size(), 1u);
    EXPECT_NEAR(returns[0], 0.1, 1e-12);
}

TEST_F(ReturnTrackerTest, UnknownSymbolHasNoHistory) {
    ReturnTracker tracker;
    EXPECT_TRUE(tracker.get_returns("DOGE/USDT").empty());
    EXPECT_EQ(tracker.history_size("DOGE/USDT"), 0u);
    EXPECT_TRUE(tracker.tracked_symbols().empty());
}

TEST_F(ReturnTrackerTest, HistoryIsBounded) {
    ReturnTracker tracker(5);
    for (int i = 0; i < 12; ++i) {
        ASSERT_TRUE(tracker.record_price("ETH/USDT", 100.0 + i).is_ok());
    }

    auto returns = tracker.get_returns("ETH/USDT");
    ASSERT_EQ(returns.size(), 5u);
    EXPECT_EQ(tracker.history_size("ETH/USDT"), 5u);
    // Oldest kept return is 106 -> 107
    EXPECT_NEAR(returns.front(), 1.0 / 106.0, 1e-12);
    EXPECT_NEAR(returns.back(), 1.0 / 110.0, 1e-12);
}

TEST_F(ReturnTrackerTest, InvalidPricesRejectedWithoutMutation) {
    ReturnTracker tracker;
    ASSERT_TRUE(tracker.record_price("BTC/USDT", 100.0).is_ok());

    for (double bad : std::initializer_list<double>{0.0, -5.0, std::nan(""), INFINITY}) {
        auto result = tracker.record_price("BTC/USDT", bad);
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    }
    EXPECT_TRUE(tracker.record_price("SOL/USDT", -1.0).is_error());

    EXPECT_EQ(tracker.history_size("BTC/USDT"), 0u);
    ASSERT_EQ(tracker.tracked_symbols().size(), 1u);
    EXPECT_EQ(tracker.tracked_symbols()[0], "BTC/USDT");
}

TEST_F(ReturnTrackerTest, ZeroCapacityRejected) {
    EXPECT_THROW(ReturnTracker(0), RiskGateError);
}

TEST_F(ReturnTrackerTest, TrackedSymbolsInFirstSeenOrder) {
    ReturnTracker tracker;
    ASSERT_TRUE(tracker.record_price("SOL/USDT", 20.0).is_ok());
    ASSERT_TRUE(tracker.record_price("BTC/USDT", 100.0).is_ok());
    ASSERT_TRUE(tracker.record_price("SOL/USDT", 21.0).is_ok());

    std::vector<std::string> expected{"SOL/USDT", "BTC/USDT"};
    EXPECT_EQ(tracker.tracked_symbols(), expected);
}

TEST_F(ReturnTrackerTest, CorrelationRequiresTwoQualifyingSymbols) {
    ReturnTracker tracker;
    feed_returns(tracker, "BTC/USDT", wave(30));
    feed_returns(tracker, "ETH/USDT", wave(19));

    EXPECT_TRUE(tracker.get_correlation_matrix().empty());
    EXPECT_TRUE(tracker.get_correlation_matrix({"BTC/USDT", "ETH/USDT"}).empty());

    feed_returns(tracker, "SOL/USDT", wave(25, 0.02, 1.0));
    auto corr = tracker.get_correlation_matrix();
    ASSERT_EQ(corr.size(), 2u);
    EXPECT_FALSE(corr.contains("ETH/USDT"));
}

TEST_F(ReturnTrackerTest, PerfectCorrelationAndAntiCorrelation) {
    ReturnTracker tracker;
    auto base = wave(40);
    feed_returns(tracker, "BTC/USDT", base);
    feed_returns(tracker, "WBTC/USDT", base, 250.0);
    feed_returns(tracker, "INV/USDT", negated(base));

    auto corr = tracker.get_correlation_matrix();
    ASSERT_EQ(corr.size(), 3u);

    EXPECT_NEAR(corr.correlation("BTC/USDT", "WBTC/USDT").value(), 1.0, 1e-9);
    EXPECT_NEAR(corr.correlation("BTC/USDT", "INV/USDT").value(), -1.0, 1e-9);
    EXPECT_DOUBLE_EQ(corr.correlation("INV/USDT", "INV/USDT").value(), 1.0);

    auto missing = corr.correlation("BTC/USDT", "XRP/USDT");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ReturnTrackerTest, CorrelationIsSymmetricAndBounded) {
    ReturnTracker tracker;
    feed_returns(tracker, "A", wave(60, 0.01, 0.0));
    feed_returns(tracker, "B", wave(45, 0.03, 0.9));
    feed_returns(tracker, "C", wave(80, 0.02, 2.1));

    auto corr = tracker.get_correlation_matrix();
    ASSERT_EQ(corr.size(), 3u);
    for (long i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(corr.values(i, i), 1.0);
        for (long j = 0; j < 3; ++j) {
            EXPECT_DOUBLE_EQ(corr.values(i, j), corr.values(j, i));
            EXPECT_LE(std::abs(corr.values(i, j)), 1.0);
        }
    }
}

TEST_F(ReturnTrackerTest, FlatSeriesHasZeroCorrelation) {
    ReturnTracker tracker;
    feed_returns(tracker, "BTC/USDT", wave(25));
    feed_returns(tracker, "USDC/USDT", std::vector<double>(25, 0.0));

    auto corr = tracker.get_correlation_matrix();
    ASSERT_EQ(corr.size(), 2u);
    EXPECT_DOUBLE_EQ(corr.correlation("BTC/USDT", "USDC/USDT").value(), 0.0);
}

TEST_F(ReturnTrackerTest, VaRZeroWithoutEnoughHistory) {
    ReturnTracker tracker;
    feed_returns(tracker, "BTC/USDT", wave(19));

    auto var = tracker.compute_var({{"BTC/USDT", 1.0}}, 10000.0, VaRMethod::HISTORICAL);
    EXPECT_DOUBLE_EQ(var.var_95, 0.0);
    EXPECT_DOUBLE_EQ(var.var_99, 0.0);
    EXPECT_DOUBLE_EQ(var.cvar_95, 0.0);
    EXPECT_DOUBLE_EQ(var.cvar_99, 0.0);
    EXPECT_EQ(var.method, VaRMethod::HISTORICAL);
    EXPECT_EQ(var.window_days, 0);
}

TEST_F(ReturnTrackerTest, HistoricalVaR) {
    ReturnTracker tracker;
    // Returns -1.0%, -0.9%, ... , +0.9%
    std::vector<double> returns;
    for (int i = 0; i < 20; ++i) {
        returns.push_back(0.001 * (i - 10));
    }
    feed_returns(tracker, "BTC/USDT", returns);

    auto var = tracker.compute_var({{"BTC/USDT", 1.0}}, 10000.0, VaRMethod::HISTORICAL);
    EXPECT_EQ(var.window_days, 20);
    EXPECT_DOUBLE_EQ(var.var_95, 90.0);
    EXPECT_DOUBLE_EQ(var.var_99, 100.0);
    EXPECT_DOUBLE_EQ(var.cvar_95, 95.0);
    EXPECT_DOUBLE_EQ(var.cvar_99, 100.0);
    EXPECT_EQ(var.method, VaRMethod::HISTORICAL);
}

TEST_F(ReturnTrackerTest, ParametricVaR) {
    ReturnTracker tracker;
    std::vector<double> returns;
    for (int i = 0; i < 20; ++i) {
        returns.push_back(i % 2 == 0 ? 0.01 : -0.01);
    }
    feed_returns(tracker, "BTC/USDT", returns);

    auto var = tracker.compute_var({{"BTC/USDT", 1.0}}, 10000.0);
    EXPECT_EQ(var.method, VaRMethod::PARAMETRIC);
    EXPECT_EQ(var.window_days, 20);
    EXPECT_NEAR(var.var_95, 164.49, 0.011);
    EXPECT_NEAR(var.var_99, 232.63, 0.011);
    EXPECT_NEAR(var.cvar_95, 206.27, 0.011);
    EXPECT_NEAR(var.cvar_99, 266.52, 0.011);
    EXPECT_GE(var.var_99, var.var_95);
    EXPECT_GE(var.cvar_95, var.var_95);
    EXPECT_GE(var.cvar_99, var.var_99);
}

TEST_F(ReturnTrackerTest, ParametricVaRScalesWithWeight) {
    ReturnTracker tracker;
    feed_returns(tracker, "BTC/USDT", wave(50));

    auto full = tracker.compute_var({{"BTC/USDT", 1.0}}, 10000.0);
    auto half = tracker.compute_var({{"BTC/USDT", 0.5}}, 10000.0);
    EXPECT_GT(full.var_95, 0.0);
    EXPECT_NEAR(half.var_95, full.var_95 / 2.0, 0.011);
}

TEST_F(ReturnTrackerTest, ParametricVaRZeroVolatility) {
    ReturnTracker tracker;
    feed_returns(tracker, "USDC/USDT", std::vector<double>(20, 0.0), 1.0);

    auto var = tracker.compute_var({{"USDC/USDT", 1.0}}, 10000.0);
    EXPECT_DOUBLE_EQ(var.var_95, 0.0);
    EXPECT_DOUBLE_EQ(var.cvar_99, 0.0);
    EXPECT_EQ(var.window_days, 20);
}

TEST_F(ReturnTrackerTest, VaRIgnoresUntrackedWeights) {
    ReturnTracker tracker;
    std::vector<double> returns;
    for (int i = 0; i < 20; ++i) {
        returns.push_back(0.001 * (i - 10));
    }
    feed_returns(tracker, "BTC/USDT", returns);

    auto var = tracker.compute_var({{"BTC/USDT", 1.0}, {"XRP/USDT", 0.5}}, 10000.0,
                                   VaRMethod::HISTORICAL);
    EXPECT_DOUBLE_EQ(var.var_99, 100.0);
}

TEST_F(ReturnTrackerTest, VaRUsesShortestHistory) {
    ReturnTracker tracker;
    feed_returns(tracker, "BTC/USDT", wave(60));
    feed_returns(tracker, "ETH/USDT", wave(25, 0.02));

    auto var = tracker.compute_var({{"BTC/USDT", 0.5}, {"ETH/USDT", 0.5}}, 10000.0);
    EXPECT_EQ(var.window_days, 25);
}
