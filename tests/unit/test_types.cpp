// ============================================================================
// TRADEFORCE ENGINE - Core Types Unit Tests
// ============================================================================

#include "tradeforce/core/error.hpp"
#include "tradeforce/core/types.hpp"

#include <gtest/gtest.h>

using namespace tradeforce;

// ============================================================================
// Signal Tests
// ============================================================================

TEST(SignalTest, ToString) {
    EXPECT_EQ(to_string(Signal::Buy), "buy");
    EXPECT_EQ(to_string(Signal::Sell), "sell");
    EXPECT_EQ(to_string(Signal::Hold), "hold");
}

TEST(SignalTest, Parse) {
    EXPECT_EQ(parse_signal("buy"), Signal::Buy);
    EXPECT_EQ(parse_signal("sell"), Signal::Sell);
    EXPECT_EQ(parse_signal("hold"), Signal::Hold);
    EXPECT_FALSE(parse_signal("BUY").has_value());
    EXPECT_FALSE(parse_signal("").has_value());
}

TEST(SideTest, ToString) {
    EXPECT_EQ(to_string(Side::Buy), "BUY");
    EXPECT_EQ(to_string(Side::Sell), "SELL");
}

// ============================================================================
// SignalStrength Tests
// ============================================================================

TEST(SignalStrengthTest, DefaultIsNeutral) {
    SignalStrength s;
    EXPECT_TRUE(s.is_neutral());
    EXPECT_EQ(s.direction(), Signal::Hold);
}

TEST(SignalStrengthTest, Clamped) {
    EXPECT_DOUBLE_EQ(SignalStrength{2.5}.value(), 1.0);
    EXPECT_DOUBLE_EQ(SignalStrength{-3.0}.value(), -1.0);
    EXPECT_DOUBLE_EQ(SignalStrength{0.4}.value(), 0.4);
}

TEST(SignalStrengthTest, Direction) {
    EXPECT_EQ(SignalStrength{0.3}.direction(), Signal::Buy);
    EXPECT_TRUE(SignalStrength{0.3}.is_bullish());
    EXPECT_EQ(SignalStrength{-0.3}.direction(), Signal::Sell);
    EXPECT_TRUE(SignalStrength{-0.3}.is_bearish());
}

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST(TimestampTest, EpochRoundTrip) {
    const int64_t ms = 1700000000123;
    EXPECT_EQ(to_epoch_ms(from_epoch_ms(ms)), ms);
}

TEST(TimestampTest, NowIsRecent) {
    EXPECT_GT(to_epoch_ms(now()), 1600000000000);
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(EngineErrorTest, CarriesCode) {
    EngineError error(ErrorCode::MarketDataUnavailable, "feed down");
    EXPECT_EQ(error.code(), ErrorCode::MarketDataUnavailable);
    EXPECT_STREQ(error.what(), "feed down");
    EXPECT_EQ(to_string(error.code()), "MarketDataUnavailable");
}
