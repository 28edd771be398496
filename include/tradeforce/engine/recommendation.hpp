#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Recommendation
// ============================================================================
// Result of one asset analysis. A failed analysis is still a Recommendation:
// hold, confidence 0, with error and error_code set.
// ============================================================================

#include "tradeforce/core/error.hpp"
#include "tradeforce/core/types.hpp"
#include "tradeforce/engine/consensus_aggregator.hpp"
#include "tradeforce/risk/risk_calculator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tradeforce::engine {

/// Per-call analysis state machine: Idle -> Fetching -> Voting -> Scoring -> Done
enum class AnalysisState : uint8_t {
    Idle,
    Fetching,
    Voting,
    Scoring,
    Done,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(AnalysisState state) noexcept {
    switch (state) {
        case AnalysisState::Idle:     return "idle";
        case AnalysisState::Fetching: return "fetching";
        case AnalysisState::Voting:   return "voting";
        case AnalysisState::Scoring:  return "scoring";
        case AnalysisState::Done:     return "done";
        case AnalysisState::Failed:   return "failed";
    }
    return "idle";
}

/// Where current_price came from
enum class PriceSource : uint8_t {
    Explicit,   // MarketData::price
    LastClose,  // Last close of the series
    Fallback    // Configured fallback_price
};

[[nodiscard]] constexpr std::string_view to_string(PriceSource source) noexcept {
    switch (source) {
        case PriceSource::Explicit:  return "explicit";
        case PriceSource::LastClose: return "last_close";
        case PriceSource::Fallback:  return "fallback";
    }
    return "fallback";
}

struct Recommendation {
    std::string asset;
    std::string timeframe;
    double current_price = 0.0;
    PriceSource price_source = PriceSource::Fallback;

    Signal signal = Signal::Hold;
    double confidence = 0.0;
    bool has_consensus = false;
    HoldReason hold_reason = HoldReason::NoVotes;

    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<double> risk_reward;
    std::optional<risk::PositionSize> position;

    Timestamp timestamp{};

    std::vector<SignalVote> votes;
    uint32_t buy_signals = 0;
    uint32_t sell_signals = 0;
    uint32_t hold_signals = 0;
    uint32_t total_signals = 0;
    double total_weight = 0.0;

    AnalysisState state = AnalysisState::Idle;
    std::optional<std::string> error;
    std::optional<ErrorCode> error_code;

    /// True when the price is the configured fallback, not market data
    [[nodiscard]] bool degraded_price() const { return price_source == PriceSource::Fallback; }

    [[nodiscard]] bool failed() const { return state == AnalysisState::Failed; }

    [[nodiscard]] bool is_actionable() const {
        return signal != Signal::Hold && has_consensus && !failed();
    }
};

}  // namespace tradeforce::engine
