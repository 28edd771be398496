#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Consensus Aggregator
// ============================================================================
// Runs the selected strategies sequentially and reduces their weighted
// votes into one signal:
//   buy  if buy_signals  > sell_signals and buy_conf  / total_weight > threshold
//   sell if sell_signals > buy_signals  and sell_conf / total_weight > threshold
//   hold (confidence 0.5) otherwise; hold (confidence 0) with no weight at all
// ============================================================================

#include "tradeforce/core/types.hpp"
#include "tradeforce/market/market_data.hpp"
#include "tradeforce/strategy/strategy_registry.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tradeforce::engine {

/// Why the consensus is Hold
enum class HoldReason : uint8_t {
    None = 0,        // Directional signal
    NoVotes,         // No strategy produced a weighted vote
    Tie,             // buy_signals == sell_signals
    BelowThreshold,  // Majority existed but its weighted confidence was too low
    Failed           // Analysis did not reach the vote
};

[[nodiscard]] constexpr std::string_view to_string(HoldReason reason) noexcept {
    switch (reason) {
        case HoldReason::None:           return "none";
        case HoldReason::NoVotes:        return "no_votes";
        case HoldReason::Tie:            return "tie";
        case HoldReason::BelowThreshold: return "below_threshold";
        case HoldReason::Failed:         return "failed";
    }
    return "none";
}

struct SignalVote {
    std::string strategy;
    Signal signal = Signal::Hold;
    double confidence = 0.0;
    double weight = 0.0;
};

struct ConsensusResult {
    Signal signal = Signal::Hold;
    double confidence = 0.0;
    bool has_consensus = false;
    HoldReason hold_reason = HoldReason::NoVotes;

    std::vector<SignalVote> votes;
    uint32_t buy_signals = 0;
    uint32_t sell_signals = 0;
    uint32_t hold_signals = 0;
    double buy_confidence = 0.0;   // Sum of confidence * weight over buy votes
    double sell_confidence = 0.0;
    double total_weight = 0.0;

    [[nodiscard]] uint32_t total_signals() const { return buy_signals + sell_signals + hold_signals; }
};

class ConsensusAggregator {
public:
    explicit ConsensusAggregator(double threshold = 0.7) : threshold_(threshold) {}

    /// Execute each enabled entry in order; failing strategies are logged and skipped
    [[nodiscard]] ConsensusResult evaluate(const std::vector<strategy::StrategyEntry>& entries,
                                           const market::MarketData& data,
                                           const std::string& timeframe = {},
                                           bool enforce_timeframes = false) const;

    /// Apply the decision rule to already collected votes
    [[nodiscard]] ConsensusResult tally(std::vector<SignalVote> votes) const;

    [[nodiscard]] double threshold() const { return threshold_; }
    void set_threshold(double threshold) { threshold_ = threshold; }

private:
    double threshold_;
};

}  // namespace tradeforce::engine
