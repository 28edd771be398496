// ============================================================================
// TRADEFORCE ENGINE - Consensus Aggregator Implementation
// ============================================================================

#include "tradeforce/engine/consensus_aggregator.hpp"
#include "tradeforce/core/error.hpp"
#include "tradeforce/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <utility>

namespace tradeforce::engine {

namespace {

std::optional<strategy::StrategyResult> run_strategy(const strategy::StrategyEntry& entry,
                                                     const market::MarketData& data) {
    try {
        return entry.fn(data, entry.config.params);
    } catch (const std::exception& e) {
        LOG_WARN("Strategy {} skipped ({}): {}", entry.config.key,
                 to_string(ErrorCode::StrategyExecutionError), e.what());
    } catch (...) {
        LOG_WARN("Strategy {} skipped ({}): unknown exception", entry.config.key,
                 to_string(ErrorCode::StrategyExecutionError));
    }
    return std::nullopt;
}

}  // namespace

ConsensusResult ConsensusAggregator::evaluate(const std::vector<strategy::StrategyEntry>& entries,
                                              const market::MarketData& data,
                                              const std::string& timeframe,
                                              bool enforce_timeframes) const {
    std::vector<SignalVote> votes;
    votes.reserve(entries.size());

    for (const auto& entry : entries) {
        const auto& config = entry.config;
        if (!config.enabled) continue;

        if (enforce_timeframes && !config.supports_timeframe(timeframe)) {
            LOG_DEBUG("Strategy {} does not run on {}", config.key, timeframe);
            continue;
        }

        auto result = run_strategy(entry, data);
        if (!result) continue;

        if (!std::isfinite(result->confidence)) {
            LOG_WARN("Strategy {} skipped ({}): non-finite confidence", config.key,
                     to_string(ErrorCode::StrategyExecutionError));
            continue;
        }

        votes.push_back(SignalVote{config.key, result->signal,
                                   std::clamp(result->confidence, 0.0, 1.0), config.weight});
        LOG_TRACE("Vote {}: {} ({:.3f} x {:.2f})", config.key, to_string(result->signal),
                  votes.back().confidence, config.weight);
    }

    return tally(std::move(votes));
}

ConsensusResult ConsensusAggregator::tally(std::vector<SignalVote> votes) const {
    ConsensusResult result;

    for (const auto& vote : votes) {
        switch (vote.signal) {
            case Signal::Buy:
                ++result.buy_signals;
                result.buy_confidence += vote.confidence * vote.weight;
                break;
            case Signal::Sell:
                ++result.sell_signals;
                result.sell_confidence += vote.confidence * vote.weight;
                break;
            case Signal::Hold:
                ++result.hold_signals;
                break;
        }
        result.total_weight += vote.weight;
    }
    result.votes = std::move(votes);

    if (result.total_weight <= 0.0) {
        result.signal = Signal::Hold;
        result.confidence = 0.0;
        result.has_consensus = false;
        result.hold_reason = HoldReason::NoVotes;
        return result;
    }

    const double buy_ratio = result.buy_confidence / result.total_weight;
    const double sell_ratio = result.sell_confidence / result.total_weight;

    if (result.buy_signals > result.sell_signals && buy_ratio > threshold_) {
        result.signal = Signal::Buy;
        result.confidence = buy_ratio;
        result.hold_reason = HoldReason::None;
    } else if (result.sell_signals > result.buy_signals && sell_ratio > threshold_) {
        result.signal = Signal::Sell;
        result.confidence = sell_ratio;
        result.hold_reason = HoldReason::None;
    } else {
        result.signal = Signal::Hold;
        result.confidence = 0.5;
        result.hold_reason = result.buy_signals == result.sell_signals ? HoldReason::Tie
                                                                       : HoldReason::BelowThreshold;
    }

    result.confidence = std::clamp(result.confidence, 0.0, 1.0);
    result.has_consensus = result.confidence >= threshold_;
    return result;
}

}  // namespace tradeforce::engine
