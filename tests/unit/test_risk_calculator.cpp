// ============================================================================
// TRADEFORCE ENGINE - Risk Calculator Unit Tests
// ============================================================================

#include "tradeforce/risk/risk_calculator.hpp"

#include <gtest/gtest.h>

using namespace tradeforce;
using namespace tradeforce::risk;

class RiskCalculatorTest : public ::testing::Test {
protected:
    RiskCalculator calculator;  // 2% stop, 5% target, 1000 balance
};

TEST_F(RiskCalculatorTest, BuyLevels) {
    auto levels = calculator.calculate(Signal::Buy, 0.9, 100.0);

    ASSERT_TRUE(levels.stop_loss.has_value());
    ASSERT_TRUE(levels.take_profit.has_value());
    ASSERT_TRUE(levels.risk_reward.has_value());
    EXPECT_NEAR(*levels.stop_loss, 98.80, 1e-9);
    EXPECT_NEAR(*levels.take_profit, 106.75, 1e-9);
    EXPECT_NEAR(*levels.risk_reward, 5.625, 1e-9);
}

TEST_F(RiskCalculatorTest, SellLevelsMirrorBuy) {
    auto levels = calculator.calculate(Signal::Sell, 0.9, 100.0);

    ASSERT_TRUE(levels.stop_loss.has_value());
    EXPECT_NEAR(*levels.stop_loss, 101.20, 1e-9);
    EXPECT_NEAR(*levels.take_profit, 93.25, 1e-9);
    EXPECT_NEAR(*levels.risk_reward, 5.625, 1e-9);
}

TEST_F(RiskCalculatorTest, HoldHasNoLevels) {
    auto levels = calculator.calculate(Signal::Hold, 0.9, 100.0);

    EXPECT_FALSE(levels.stop_loss.has_value());
    EXPECT_FALSE(levels.take_profit.has_value());
    EXPECT_FALSE(levels.risk_reward.has_value());
    EXPECT_FALSE(levels.position.has_value());
}

TEST_F(RiskCalculatorTest, PercentagesMonotonicInConfidence) {
    double prev_sl = RiskCalculator::stop_loss_percent(0.02, 0.0);
    double prev_tp = RiskCalculator::take_profit_percent(0.05, 0.0);

    for (int i = 1; i <= 10; ++i) {
        const double confidence = i / 10.0;
        const double sl = RiskCalculator::stop_loss_percent(0.02, confidence);
        const double tp = RiskCalculator::take_profit_percent(0.05, confidence);
        EXPECT_LE(sl, prev_sl);
        EXPECT_GE(tp, prev_tp);
        prev_sl = sl;
        prev_tp = tp;
    }
}

TEST_F(RiskCalculatorTest, BuyStopBelowAndTargetAbovePrice) {
    for (double confidence : {0.1, 0.5, 0.7, 1.0}) {
        auto levels = calculator.calculate(Signal::Buy, confidence, 250.0);
        EXPECT_LT(*levels.stop_loss, 250.0);
        EXPECT_GT(*levels.take_profit, 250.0);
    }
}

TEST_F(RiskCalculatorTest, ZeroPriceHasNoRiskReward) {
    auto levels = calculator.calculate(Signal::Buy, 0.9, 0.0);

    ASSERT_TRUE(levels.stop_loss.has_value());
    EXPECT_DOUBLE_EQ(*levels.stop_loss, 0.0);
    EXPECT_FALSE(levels.risk_reward.has_value());
    ASSERT_TRUE(levels.position.has_value());
    EXPECT_DOUBLE_EQ(levels.position->quantity, 0.0);
}

TEST_F(RiskCalculatorTest, PositionScalesWithConfidence) {
    // 1000 * 0.02 * 0.9 = 18, under the 50 cap
    auto size = calculator.size_position(Signal::Buy, 0.9, 100.0);

    ASSERT_TRUE(size.has_value());
    EXPECT_NEAR(size->notional, 18.0, 1e-9);
    EXPECT_NEAR(size->quantity, 0.18, 1e-9);
    EXPECT_FALSE(calculator.size_position(Signal::Hold, 0.9, 100.0).has_value());
}

TEST_F(RiskCalculatorTest, PositionCappedByMaxPosition) {
    RiskConfig config;
    config.account_balance = 10000.0;
    config.risk_per_trade_pct = 0.5;
    config.max_position_pct = 0.05;
    RiskCalculator aggressive(config);

    auto size = aggressive.size_position(Signal::Sell, 1.0, 50.0);
    ASSERT_TRUE(size.has_value());
    EXPECT_NEAR(size->notional, 500.0, 1e-9);
    EXPECT_NEAR(size->quantity, 10.0, 1e-9);
}

TEST_F(RiskCalculatorTest, ConfigUpdate) {
    RiskConfig config;
    config.base_stop_loss_pct = 0.1;
    calculator.set_config(config);

    EXPECT_DOUBLE_EQ(calculator.config().base_stop_loss_pct, 0.1);
    auto levels = calculator.calculate(Signal::Buy, 0.5, 100.0);
    EXPECT_NEAR(*levels.stop_loss, 90.0, 1e-9);
}
