#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "riskgate/regime/regime_history.hpp"

using namespace riskgate;
using namespace riskgate::testing;

class RegimeHistoryTest : public TestBase {
protected:
    static RegimeState state_for(Regime regime, double confidence) {
        RegimeState state;
        state.regime = regime;
        state.confidence = confidence;
        return state;
    }

    RegimeHistory history_;
};

TEST_F(RegimeHistoryTest, EmptyHistory) {
    EXPECT_FALSE(history_.latest("BTC/USDT").has_value());
    EXPECT_TRUE(history_.get_history("BTC/USDT").empty());
    EXPECT_EQ(history_.size("BTC/USDT"), 0u);
    EXPECT_TRUE(history_.to_json("BTC/USDT").empty());
}

TEST_F(RegimeHistoryTest, RecordsPerSymbol) {
    history_.record("BTC/USDT", state_for(Regime::RANGING, 0.6), bar_time(0));
    history_.record("BTC/USDT", state_for(Regime::WEAK_TREND_UP, 0.7), bar_time(1));
    history_.record("ETH/USDT", state_for(Regime::HIGH_VOLATILITY, 0.9), bar_time(1));

    auto latest = history_.latest("BTC/USDT");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->state.regime, Regime::WEAK_TREND_UP);
    EXPECT_EQ(latest->timestamp, bar_time(1));

    EXPECT_EQ(history_.size("BTC/USDT"), 2u);
    EXPECT_EQ(history_.size("ETH/USDT"), 1u);
    EXPECT_EQ(history_.symbols(), (std::vector<std::string>{"BTC/USDT", "ETH/USDT"}));
}

TEST_F(RegimeHistoryTest, LimitReturnsNewestOldestFirst) {
    for (int i = 0; i < 10; ++i) {
        history_.record("BTC/USDT", state_for(Regime::RANGING, 0.3 + 0.05 * i), bar_time(i));
    }

    auto recent = history_.get_history("BTC/USDT", 3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].timestamp, bar_time(7));
    EXPECT_EQ(recent[2].timestamp, bar_time(9));

    EXPECT_EQ(history_.get_history("BTC/USDT").size(), 10u);
}

TEST_F(RegimeHistoryTest, TrimsOnceAboveCapacity) {
    for (size_t i = 0; i < RegimeHistory::kMaxEntries; ++i) {
        history_.record("BTC/USDT", state_for(Regime::RANGING, 0.5), bar_time(static_cast<int>(i)));
    }
    EXPECT_EQ(history_.size("BTC/USDT"), RegimeHistory::kMaxEntries);

    history_.record("BTC/USDT", state_for(Regime::HIGH_VOLATILITY, 0.8),
                    bar_time(static_cast<int>(RegimeHistory::kMaxEntries)));
    EXPECT_EQ(history_.size("BTC/USDT"), RegimeHistory::kTrimTo);

    auto all = history_.get_history("BTC/USDT", RegimeHistory::kMaxEntries);
    ASSERT_EQ(all.size(), RegimeHistory::kTrimTo);
    EXPECT_EQ(all.front().timestamp, bar_time(static_cast<int>(RegimeHistory::kMaxEntries -
                                                               RegimeHistory::kTrimTo + 1)));
    EXPECT_EQ(all.back().state.regime, Regime::HIGH_VOLATILITY);
}

TEST_F(RegimeHistoryTest, JsonCarriesTimestamp) {
    history_.record("BTC/USDT", state_for(Regime::STRONG_TREND_DOWN, 0.91), bar_time(0));

    auto j = history_.to_json("BTC/USDT");
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["regime"].get<std::string>(), "strong_trend_down");
    EXPECT_EQ(j[0]["timestamp"].get<std::string>(), "2024-01-01T00:00:00Z");
}
