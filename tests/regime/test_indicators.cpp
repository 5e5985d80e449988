#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "riskgate/regime/indicators.hpp"

using namespace riskgate;

class IndicatorsTest : public ::testing::Test {
protected:
    static const double kNaN;
};

const double IndicatorsTest::kNaN = std::nan("");

TEST_F(IndicatorsTest, EmaRecursiveForm) {
    auto out = indicators::ema({1.0, 2.0, 3.0}, 3);  // alpha = 0.5
    ASSERT_EQ(out.size(), 3u);
    EXPECT_DOUBLE_EQ(out[0], 1.0);
    EXPECT_DOUBLE_EQ(out[1], 1.5);
    EXPECT_DOUBLE_EQ(out[2], 2.25);
}

TEST_F(IndicatorsTest, EmaCarriesThroughMissingValues) {
    auto out = indicators::ema({kNaN, 4.0, kNaN, 8.0}, 3);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_DOUBLE_EQ(out[1], 4.0);
    EXPECT_DOUBLE_EQ(out[2], 4.0);
    EXPECT_DOUBLE_EQ(out[3], 6.0);
}

TEST_F(IndicatorsTest, SimpleMovingAverage) {
    auto out = indicators::sma({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 2.0);
    EXPECT_DOUBLE_EQ(out[3], 3.0);
    EXPECT_DOUBLE_EQ(out[4], 4.0);

    EXPECT_TRUE(std::isnan(indicators::sma({1.0, 2.0}, 3)[1]));
}

TEST_F(IndicatorsTest, RollingSampleStd) {
    auto out = indicators::rolling_std({1.0, 2.0, 4.0}, 3);
    EXPECT_TRUE(std::isnan(out[1]));
    // Sample variance of {1, 2, 4} = 7/3
    EXPECT_NEAR(out[2], std::sqrt(7.0 / 3.0), 1e-12);
}

TEST_F(IndicatorsTest, WilderSmoothing) {
    auto out = indicators::wilder_smooth({2.0, 4.0, kNaN, 8.0}, 2, 2);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_DOUBLE_EQ(out[1], 3.0);
    EXPECT_DOUBLE_EQ(out[2], 3.0);
    EXPECT_DOUBLE_EQ(out[3], 5.5);
}

TEST_F(IndicatorsTest, AdxOfCleanTrend) {
    std::vector<double> high, low, close;
    for (int i = 0; i < 40; ++i) {
        close.push_back(10.0 + i);
        high.push_back(10.5 + i);
        low.push_back(9.5 + i);
    }

    auto out = indicators::adx(high, low, close, 14);
    ASSERT_EQ(out.size(), 40u);
    // DX is defined from bar 13, ADX after 14 DX values
    EXPECT_TRUE(std::isnan(out[25]));
    EXPECT_NEAR(out[26], 100.0, 1e-9);
    EXPECT_NEAR(out[39], 100.0, 1e-9);
}

TEST_F(IndicatorsTest, AdxBoundedOnChoppySeries) {
    std::vector<double> high, low, close;
    for (int i = 0; i < 120; ++i) {
        double c = 100.0 + 3.0 * std::sin(0.5 * i) + 0.02 * i;
        close.push_back(c);
        high.push_back(c + 1.0 + 0.3 * std::cos(1.3 * i));
        low.push_back(c - 1.0 - 0.2 * std::sin(0.7 * i));
    }

    auto out = indicators::adx(high, low, close, 14);
    for (size_t i = 26; i < out.size(); ++i) {
        ASSERT_FALSE(std::isnan(out[i])) << "index " << i;
        EXPECT_GE(out[i], 0.0);
        EXPECT_LE(out[i], 100.0);
    }
}

TEST_F(IndicatorsTest, BollingerWidth) {
    auto out = indicators::bollinger_width({1.0, 2.0, 3.0}, 3, 2.0);
    // mid 2, sample std 1: (upper - lower) / mid = 4 / 2
    EXPECT_TRUE(std::isnan(out[1]));
    EXPECT_DOUBLE_EQ(out[2], 2.0);

    auto flat = indicators::bollinger_width(std::vector<double>(25, 50.0), 20, 2.0);
    EXPECT_DOUBLE_EQ(flat[24], 0.0);
}

TEST_F(IndicatorsTest, PercentileRankCountsValuesAtOrBelow) {
    auto out = indicators::rolling_percentile_rank({3.0, 1.0, 2.0, 5.0}, 3, 2);
    EXPECT_TRUE(std::isnan(out[0]));
    EXPECT_DOUBLE_EQ(out[1], 50.0);
    EXPECT_NEAR(out[2], 200.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(out[3], 100.0);
}

TEST_F(IndicatorsTest, PercentileRankCountsMissingValuesInWindowLength) {
    auto out = indicators::rolling_percentile_rank({kNaN, kNaN, 4.0, 2.0, kNaN, 3.0}, 10, 2);
    EXPECT_TRUE(std::isnan(out[2]));
    EXPECT_DOUBLE_EQ(out[3], 25.0);
    EXPECT_TRUE(std::isnan(out[4]));
    EXPECT_NEAR(out[5], 100.0 / 3.0, 1e-12);
}

TEST_F(IndicatorsTest, PercentileRankAfterWarmupGap) {
    std::vector<double> series(19, kNaN);
    for (int v = 1; v <= 30; ++v) {
        series.push_back(static_cast<double>(v));
    }
    auto out = indicators::rolling_percentile_rank(series, 49, 20);
    EXPECT_TRUE(std::isnan(out[37]));
    EXPECT_NEAR(out[38], 2000.0 / 39.0, 1e-9);
    EXPECT_NEAR(out[48], 3000.0 / 49.0, 1e-9);
}

TEST_F(IndicatorsTest, RollingExtremesUsePartialWindows) {
    std::vector<double> series{3.0, 1.0, 4.0, 1.0, 5.0};
    auto hi = indicators::rolling_max(series, 2);
    auto lo = indicators::rolling_min(series, 2);
    EXPECT_EQ(hi, (std::vector<double>{3.0, 3.0, 4.0, 4.0, 5.0}));
    EXPECT_EQ(lo, (std::vector<double>{3.0, 1.0, 1.0, 1.0, 1.0}));
}
