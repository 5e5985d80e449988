#include <gtest/gtest.h>
#include "riskgate/regime/regime_types.hpp"

using namespace riskgate;

class RegimeTypesTest : public ::testing::Test {};

TEST_F(RegimeTypesTest, NamesRoundTrip) {
    for (size_t i = 0; i < kRegimeCount; ++i) {
        Regime regime = static_cast<Regime>(i);
        auto parsed = regime_from_string(regime_to_string(regime));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, regime);
    }
    EXPECT_EQ(regime_to_string(Regime::HIGH_VOLATILITY), "high_volatility");
    EXPECT_FALSE(regime_from_string("sideways").has_value());
}

TEST_F(RegimeTypesTest, ScoredRegimesExcludeUnknown) {
    for (Regime regime : kScoredRegimes) {
        EXPECT_NE(regime, Regime::UNKNOWN);
    }
    EXPECT_EQ(kScoredRegimes.size(), kRegimeCount - 1);
}

TEST_F(RegimeTypesTest, ConfigDefaultsAreValid) {
    RegimeConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_DOUBLE_EQ(config.adx_strong, 40.0);
    EXPECT_DOUBLE_EQ(config.adx_weak, 25.0);
    EXPECT_EQ(config.transition_lookback, 50);
    EXPECT_EQ(config.hysteresis_bars, 3);
}

TEST_F(RegimeTypesTest, ConfigRejectsInconsistentValues) {
    RegimeConfig config;
    config.adx_weak = 40.0;
    EXPECT_THROW(config.validate(), RiskGateError);

    config = RegimeConfig();
    config.alignment_ema_periods = {21, 0};
    EXPECT_THROW(config.validate(), RiskGateError);

    config = RegimeConfig();
    nlohmann::json j;
    j["bb_period"] = -1;
    EXPECT_THROW(config.from_json(j), RiskGateError);
}

TEST_F(RegimeTypesTest, ConfigJsonRoundTrip) {
    RegimeConfig config;
    config.alignment_ema_periods = {10, 30};
    config.bb_std = 2.5;

    RegimeConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.alignment_ema_periods, (std::vector<int>{10, 30}));
    EXPECT_DOUBLE_EQ(loaded.bb_std, 2.5);
}

TEST_F(RegimeTypesTest, StateJsonRoundsValues) {
    RegimeState state;
    state.regime = Regime::WEAK_TREND_DOWN;
    state.confidence = 0.123456;
    state.adx_value = 31.98765;
    state.transition_probabilities = {{"weak_trend_down", 0.75}, {"ranging", 0.25}};

    auto j = state.to_json();
    EXPECT_EQ(j["regime"].get<std::string>(), "weak_trend_down");
    EXPECT_DOUBLE_EQ(j["confidence"].get<double>(), 0.123);
    EXPECT_DOUBLE_EQ(j["adx_value"].get<double>(), 31.99);
    EXPECT_DOUBLE_EQ(j["transition_probabilities"]["ranging"].get<double>(), 0.25);
}
