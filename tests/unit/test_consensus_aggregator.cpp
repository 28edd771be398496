// ============================================================================
// TRADEFORCE ENGINE - Consensus Aggregator Unit Tests
// ============================================================================

#include "tradeforce/engine/consensus_aggregator.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tradeforce;
using namespace tradeforce::engine;
using namespace tradeforce::strategy;

namespace {

StrategyEntry voting(const std::string& key, Signal signal, double confidence,
                     double weight = 0.2) {
    StrategyEntry entry;
    entry.config.key = key;
    entry.config.weight = weight;
    entry.fn = [signal, confidence](const market::MarketData&, const StrategyParams&) {
        return StrategyResult{signal, confidence};
    };
    return entry;
}

StrategyEntry throwing(const std::string& key) {
    StrategyEntry entry;
    entry.config.key = key;
    entry.fn = [](const market::MarketData&, const StrategyParams&) -> StrategyResult {
        throw std::runtime_error("Not enough price data");
    };
    return entry;
}

}  // namespace

class ConsensusAggregatorTest : public ::testing::Test {
protected:
    ConsensusAggregator aggregator{0.7};
    market::MarketData data;
};

TEST_F(ConsensusAggregatorTest, MajorityBelowThresholdHolds) {
    std::vector<StrategyEntry> entries{
        voting("a", Signal::Buy, 0.9),
        voting("b", Signal::Buy, 0.8),
        voting("c", Signal::Sell, 0.6),
        voting("d", Signal::Hold, 0.5),
        voting("e", Signal::Hold, 0.5),
    };

    auto result = aggregator.evaluate(entries, data);

    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_DOUBLE_EQ(result.confidence, 0.5);
    EXPECT_FALSE(result.has_consensus);
    EXPECT_EQ(result.hold_reason, HoldReason::BelowThreshold);
    EXPECT_EQ(result.buy_signals, 2u);
    EXPECT_EQ(result.sell_signals, 1u);
    EXPECT_EQ(result.hold_signals, 2u);
    EXPECT_EQ(result.total_signals(), 5u);
    EXPECT_NEAR(result.buy_confidence, 0.34, 1e-9);
    EXPECT_NEAR(result.total_weight, 1.0, 1e-9);
}

TEST_F(ConsensusAggregatorTest, UnanimousBuyReachesConsensus) {
    std::vector<StrategyEntry> entries;
    for (int i = 0; i < 5; ++i) {
        entries.push_back(voting("s" + std::to_string(i), Signal::Buy, 0.9));
    }

    auto result = aggregator.evaluate(entries, data);

    EXPECT_EQ(result.signal, Signal::Buy);
    EXPECT_NEAR(result.confidence, 0.9, 1e-9);
    EXPECT_TRUE(result.has_consensus);
    EXPECT_EQ(result.hold_reason, HoldReason::None);
    ASSERT_EQ(result.votes.size(), 5u);
    EXPECT_EQ(result.votes[0].strategy, "s0");
}

TEST_F(ConsensusAggregatorTest, UnanimousSell) {
    std::vector<StrategyEntry> entries{
        voting("a", Signal::Sell, 1.0, 0.5),
        voting("b", Signal::Sell, 0.8, 0.5),
    };

    auto result = aggregator.evaluate(entries, data);
    EXPECT_EQ(result.signal, Signal::Sell);
    EXPECT_NEAR(result.confidence, 0.9, 1e-9);
    EXPECT_TRUE(result.has_consensus);
}

TEST_F(ConsensusAggregatorTest, TieHolds) {
    std::vector<StrategyEntry> entries{
        voting("a", Signal::Buy, 1.0, 0.5),
        voting("b", Signal::Sell, 1.0, 0.5),
    };

    auto result = aggregator.evaluate(entries, data);
    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_DOUBLE_EQ(result.confidence, 0.5);
    EXPECT_EQ(result.hold_reason, HoldReason::Tie);
}

TEST_F(ConsensusAggregatorTest, RatioMustExceedThreshold) {
    // 0.8 * 0.5 + 0.8 * 0.5 == 0.8 exactly
    ConsensusAggregator strict{0.8};
    std::vector<StrategyEntry> entries{
        voting("a", Signal::Buy, 0.8, 0.5),
        voting("b", Signal::Buy, 0.8, 0.5),
    };

    auto result = strict.evaluate(entries, data);
    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_EQ(result.hold_reason, HoldReason::BelowThreshold);
}

TEST_F(ConsensusAggregatorTest, NoEntriesIsZeroConfidenceHold) {
    auto result = aggregator.evaluate({}, data);

    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_FALSE(result.has_consensus);
    EXPECT_EQ(result.hold_reason, HoldReason::NoVotes);
    EXPECT_EQ(result.total_signals(), 0u);
}

TEST_F(ConsensusAggregatorTest, ZeroWeightVotesCountAsNoVotes) {
    std::vector<StrategyEntry> entries{
        voting("a", Signal::Buy, 1.0, 0.0),
        voting("b", Signal::Buy, 1.0, 0.0),
    };

    auto result = aggregator.evaluate(entries, data);
    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.hold_reason, HoldReason::NoVotes);
    EXPECT_EQ(result.buy_signals, 2u);
}

TEST_F(ConsensusAggregatorTest, FailingStrategyIsSkipped) {
    std::vector<StrategyEntry> entries{
        throwing("broken"),
        voting("a", Signal::Buy, 0.9, 0.5),
        voting("b", Signal::Buy, 0.9, 0.5),
    };

    auto result = aggregator.evaluate(entries, data);
    EXPECT_EQ(result.signal, Signal::Buy);
    EXPECT_EQ(result.total_signals(), 2u);
    EXPECT_NEAR(result.total_weight, 1.0, 1e-9);
}

TEST_F(ConsensusAggregatorTest, AllStrategiesFailing) {
    auto result = aggregator.evaluate({throwing("x"), throwing("y")}, data);
    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_EQ(result.hold_reason, HoldReason::NoVotes);
}

TEST_F(ConsensusAggregatorTest, NonFiniteConfidenceSkippedOthersClamped) {
    std::vector<StrategyEntry> entries{
        voting("nan", Signal::Sell, std::numeric_limits<double>::quiet_NaN()),
        voting("big", Signal::Buy, 3.0, 0.5),
        voting("neg", Signal::Hold, -1.0, 0.5),
    };

    auto result = aggregator.evaluate(entries, data);
    ASSERT_EQ(result.votes.size(), 2u);
    EXPECT_DOUBLE_EQ(result.votes[0].confidence, 1.0);
    EXPECT_DOUBLE_EQ(result.votes[1].confidence, 0.0);
    EXPECT_EQ(result.sell_signals, 0u);
}

TEST_F(ConsensusAggregatorTest, DisabledStrategiesDoNotVote) {
    auto disabled = voting("off", Signal::Sell, 1.0, 0.5);
    disabled.config.enabled = false;

    auto result = aggregator.evaluate({disabled, voting("on", Signal::Buy, 0.9, 0.5)}, data);
    EXPECT_EQ(result.total_signals(), 1u);
    EXPECT_EQ(result.signal, Signal::Buy);
    EXPECT_NEAR(result.confidence, 0.9, 1e-9);
}

TEST_F(ConsensusAggregatorTest, TimeframesEnforcedOnlyWhenRequested) {
    auto daily = voting("daily", Signal::Sell, 1.0, 0.5);
    daily.config.timeframes = {"1d"};
    std::vector<StrategyEntry> entries{daily, voting("any", Signal::Buy, 1.0, 0.5)};
    entries[1].config.timeframes = {"1h", "1d"};

    auto relaxed = aggregator.evaluate(entries, data, "1h", false);
    EXPECT_EQ(relaxed.total_signals(), 2u);

    auto enforced = aggregator.evaluate(entries, data, "1h", true);
    EXPECT_EQ(enforced.total_signals(), 1u);
    EXPECT_EQ(enforced.signal, Signal::Buy);
}

TEST_F(ConsensusAggregatorTest, HoldAtThresholdReportsConsensus) {
    ConsensusAggregator lenient{0.5};
    auto result = lenient.tally({SignalVote{"a", Signal::Hold, 0.5, 1.0}});

    EXPECT_EQ(result.signal, Signal::Hold);
    EXPECT_DOUBLE_EQ(result.confidence, 0.5);
    EXPECT_TRUE(result.has_consensus);
    EXPECT_EQ(result.hold_reason, HoldReason::Tie);
}

TEST_F(ConsensusAggregatorTest, ThresholdIsAdjustable) {
    aggregator.set_threshold(0.5);
    EXPECT_DOUBLE_EQ(aggregator.threshold(), 0.5);

    auto result = aggregator.tally({SignalVote{"a", Signal::Buy, 0.6, 1.0}});
    EXPECT_EQ(result.signal, Signal::Buy);
    EXPECT_TRUE(result.has_consensus);
}
