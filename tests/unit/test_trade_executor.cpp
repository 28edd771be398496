// ============================================================================
// TRADEFORCE ENGINE - Trade Executor Unit Tests
// ============================================================================

#include "tradeforce/order/trade_executor.hpp"

#include <gtest/gtest.h>

using namespace tradeforce;
using namespace tradeforce::engine;
using namespace tradeforce::order;

namespace {

Recommendation actionable_buy() {
    Recommendation rec;
    rec.asset = "SOL";
    rec.signal = Signal::Buy;
    rec.confidence = 0.9;
    rec.has_consensus = true;
    rec.hold_reason = HoldReason::None;
    rec.current_price = 100.0;
    rec.stop_loss = 98.8;
    rec.take_profit = 106.75;
    rec.position = risk::PositionSize{0.18, 18.0};
    rec.state = AnalysisState::Done;
    return rec;
}

}  // namespace

TEST(OrderRequestTest, BuildsBracketFromRecommendation) {
    auto request = make_order_request(actionable_buy());

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->asset, "SOL");
    EXPECT_EQ(request->side, Side::Buy);
    EXPECT_DOUBLE_EQ(request->quantity, 0.18);
    EXPECT_DOUBLE_EQ(request->notional, 18.0);
    EXPECT_DOUBLE_EQ(request->entry_price, 100.0);
    EXPECT_EQ(request->stop_loss, 98.8);
    EXPECT_EQ(request->take_profit, 106.75);
}

TEST(OrderRequestTest, SellMapsToSellSide) {
    auto rec = actionable_buy();
    rec.signal = Signal::Sell;

    auto request = make_order_request(rec);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->side, Side::Sell);
}

TEST(OrderRequestTest, NothingToOrder) {
    auto hold = actionable_buy();
    hold.signal = Signal::Hold;
    EXPECT_FALSE(make_order_request(hold).has_value());

    auto failed = actionable_buy();
    failed.state = AnalysisState::Failed;
    EXPECT_FALSE(make_order_request(failed).has_value());

    auto unsized = actionable_buy();
    unsized.position.reset();
    EXPECT_FALSE(make_order_request(unsized).has_value());

    auto zero = actionable_buy();
    zero.position = risk::PositionSize{0.0, 18.0};
    EXPECT_FALSE(make_order_request(zero).has_value());
}

TEST(PaperTradeExecutorTest, AcceptsAndRecords) {
    PaperTradeExecutor executor;
    auto request = make_order_request(actionable_buy());
    ASSERT_TRUE(request.has_value());

    auto first = executor.execute(*request);
    auto second = executor.execute(*request);

    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.order_id, "paper_1");
    EXPECT_EQ(second.order_id, "paper_2");
    EXPECT_EQ(executor.history().size(), 2u);
}

TEST(PaperTradeExecutorTest, RejectsInvalidRequests) {
    PaperTradeExecutor executor;

    OrderRequest no_asset;
    no_asset.quantity = 1.0;
    EXPECT_FALSE(executor.execute(no_asset).success);

    OrderRequest no_quantity;
    no_quantity.asset = "SOL";
    auto result = executor.execute(no_quantity);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.order_id.empty());

    EXPECT_TRUE(executor.history().empty());
}
