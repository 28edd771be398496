// ============================================================================
// TRADEFORCE ENGINE - Decision Engine Implementation
// ============================================================================

#include "tradeforce/engine/decision_engine.hpp"
#include "tradeforce/core/error.hpp"
#include "tradeforce/utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace tradeforce::engine {

namespace {

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw EngineError(ErrorCode::InvalidInput, std::string(name) + " must be finite");
    }
}

}  // namespace

DecisionEngine::DecisionEngine(std::shared_ptr<market::IMarketDataProvider> provider,
                               EngineConfig config,
                               risk::RiskConfig risk_config)
    : provider_(std::move(provider)),
      config_(std::move(config)),
      risk_config_(risk_config) {
    if (!provider_) {
        throw EngineError(ErrorCode::InvalidInput, "DecisionEngine requires a market data provider");
    }

    EngineSettings initial;
    initial.consensus_threshold = config_.consensus_threshold;
    initial.base_stop_loss_pct = risk_config_.base_stop_loss_pct;
    initial.base_take_profit_pct = risk_config_.base_take_profit_pct;
    settings_ = clamp_settings(initial);
}

bool DecisionEngine::initialize() {
    if (initialized_.load()) {
        return true;
    }

    registry_.load_defaults();
    initialized_.store(true);

    LOG_INFO("Decision engine initialized: {} strategies, threshold {:.2f}, timeframe {}",
             registry_.size(), settings().consensus_threshold, config_.default_timeframe);
    return true;
}

void DecisionEngine::require_initialized(const char* operation) const {
    if (!initialized_.load()) {
        throw EngineError(ErrorCode::NotInitialized,
                          std::string(operation) + ": decision engine is not initialized");
    }
}

// ============================================================================
// Analysis
// ============================================================================

void DecisionEngine::transition(Recommendation& rec, AnalysisState next) const {
    LOG_DEBUG("{} [{}] {} -> {}", rec.asset, rec.timeframe, to_string(rec.state), to_string(next));
    rec.state = next;
}

Recommendation DecisionEngine::fail(Recommendation rec, ErrorCode code,
                                    const std::string& message) const {
    transition(rec, AnalysisState::Failed);
    rec.signal = Signal::Hold;
    rec.confidence = 0.0;
    rec.has_consensus = false;
    rec.hold_reason = HoldReason::Failed;
    rec.stop_loss.reset();
    rec.take_profit.reset();
    rec.risk_reward.reset();
    rec.position.reset();
    rec.error = message;
    rec.error_code = code;

    LOG_WARN("Analysis of '{}' failed ({}): {}", rec.asset, to_string(code), message);
    return rec;
}

market::MarketDataResult DecisionEngine::fetch(const std::string& asset,
                                               const std::string& timeframe) {
    if (config_.market_data_timeout_ms <= 0) {
        return provider_->get_market_data(asset, timeframe);
    }

    // The worker keeps the provider alive if it outlives the wait
    auto promise = std::make_shared<std::promise<market::MarketDataResult>>();
    auto future = promise->get_future();

    std::thread([provider = provider_, promise, asset, timeframe]() {
        try {
            promise->set_value(provider->get_market_data(asset, timeframe));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    const auto timeout = std::chrono::milliseconds(config_.market_data_timeout_ms);
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw EngineError(ErrorCode::MarketDataUnavailable,
                          "Market data request timed out after " +
                              std::to_string(config_.market_data_timeout_ms) + " ms");
    }
    return future.get();
}

Recommendation DecisionEngine::analyze_asset(const std::string& asset,
                                             const std::string& timeframe,
                                             const std::vector<std::string>& strategy_keys) {
    SCOPED_TIMER("analyze_asset");

    Recommendation rec;
    rec.asset = asset;
    rec.timeframe = timeframe.empty() ? config_.default_timeframe : timeframe;
    rec.timestamp = now();

    if (!initialized_.load()) {
        return fail(std::move(rec), ErrorCode::NotInitialized, "Decision engine is not initialized");
    }
    if (asset.empty()) {
        return fail(std::move(rec), ErrorCode::InvalidInput, "Asset identifier must not be empty");
    }

    // Fetching
    transition(rec, AnalysisState::Fetching);
    market::MarketDataResult market_data;
    try {
        market_data = fetch(asset, rec.timeframe);
    } catch (const std::exception& e) {
        auto failed = fail(std::move(rec), ErrorCode::MarketDataUnavailable, e.what());
        retain(failed);
        return failed;
    } catch (...) {
        auto failed = fail(std::move(rec), ErrorCode::MarketDataUnavailable,
                           "Market data provider raised an unknown exception");
        retain(failed);
        return failed;
    }

    if (!market_data.success) {
        auto failed = fail(std::move(rec), ErrorCode::MarketDataUnavailable,
                           market_data.error.empty() ? "Market data unavailable" : market_data.error);
        retain(failed);
        return failed;
    }

    const auto& data = market_data.data;
    if (data.price) {
        rec.current_price = *data.price;
        rec.price_source = PriceSource::Explicit;
    } else if (auto close = data.last_close()) {
        rec.current_price = *close;
        rec.price_source = PriceSource::LastClose;
    } else {
        rec.current_price = config_.fallback_price;
        rec.price_source = PriceSource::Fallback;
        LOG_WARN("No price for '{}' [{}], using fallback {}", asset, rec.timeframe,
                 config_.fallback_price);
    }

    const EngineSettings current = settings();

    // Voting
    transition(rec, AnalysisState::Voting);
    const ConsensusAggregator aggregator(current.consensus_threshold);
    auto consensus = aggregator.evaluate(registry_.snapshot(strategy_keys), data, rec.timeframe,
                                         config_.enforce_timeframes);

    // Scoring
    transition(rec, AnalysisState::Scoring);
    rec.signal = consensus.signal;
    rec.confidence = consensus.confidence;
    rec.has_consensus = consensus.has_consensus;
    rec.hold_reason = consensus.hold_reason;
    rec.buy_signals = consensus.buy_signals;
    rec.sell_signals = consensus.sell_signals;
    rec.hold_signals = consensus.hold_signals;
    rec.total_signals = consensus.total_signals();
    rec.total_weight = consensus.total_weight;
    rec.votes = std::move(consensus.votes);

    risk::RiskConfig risk_config = risk_config_;
    risk_config.base_stop_loss_pct = current.base_stop_loss_pct;
    risk_config.base_take_profit_pct = current.base_take_profit_pct;
    const risk::RiskCalculator calculator(risk_config);

    auto levels = calculator.calculate(rec.signal, rec.confidence, rec.current_price);
    rec.stop_loss = levels.stop_loss;
    rec.take_profit = levels.take_profit;
    rec.risk_reward = levels.risk_reward;
    rec.position = levels.position;

    transition(rec, AnalysisState::Done);
    retain(rec);

    LOG_INFO("{} [{}] {} conf={:.3f} consensus={} votes={}/{}/{} price={}{}", asset, rec.timeframe,
             to_string(rec.signal), rec.confidence, rec.has_consensus, rec.buy_signals,
             rec.sell_signals, rec.hold_signals, rec.current_price,
             rec.degraded_price() ? " (fallback)" : "");
    return rec;
}

std::vector<Recommendation> DecisionEngine::analyze_watchlist(
    const std::string& timeframe, const std::vector<std::string>& strategy_keys) {
    std::vector<Recommendation> results;
    for (const auto& asset : watchlist_.list()) {
        results.push_back(analyze_asset(asset, timeframe, strategy_keys));
    }
    return results;
}

void DecisionEngine::retain(const Recommendation& rec) {
    std::lock_guard<std::mutex> lock(recommendations_mutex_);
    last_recommendations_[rec.asset] = rec;
}

// ============================================================================
// Watchlist
// ============================================================================

bool DecisionEngine::add_to_watchlist(const std::string& asset) {
    require_initialized("add_to_watchlist");
    const bool added = watchlist_.add(asset);
    LOG_DEBUG("Watchlist + {} ({} assets)", asset, watchlist_.size());
    return added;
}

bool DecisionEngine::remove_from_watchlist(const std::string& asset) {
    require_initialized("remove_from_watchlist");
    return watchlist_.remove(asset);
}

std::vector<std::string> DecisionEngine::get_watchlist() const {
    require_initialized("get_watchlist");
    return watchlist_.list();
}

bool DecisionEngine::is_watched(const std::string& asset) const {
    require_initialized("is_watched");
    return watchlist_.contains(asset);
}

// ============================================================================
// Retained Recommendations
// ============================================================================

std::optional<Recommendation> DecisionEngine::last_recommendation(const std::string& asset) const {
    require_initialized("last_recommendation");
    std::lock_guard<std::mutex> lock(recommendations_mutex_);
    auto it = last_recommendations_.find(asset);
    if (it == last_recommendations_.end()) return std::nullopt;
    return it->second;
}

std::vector<Recommendation> DecisionEngine::recommendations(size_t limit,
                                                            double min_confidence) const {
    require_initialized("recommendations");

    std::vector<Recommendation> result;
    {
        std::lock_guard<std::mutex> lock(recommendations_mutex_);
        for (const auto& [asset, rec] : last_recommendations_) {
            if (rec.is_actionable() && rec.confidence >= min_confidence) {
                result.push_back(rec);
            }
        }
    }

    // Map iteration is ordered by asset, stable_sort keeps that for equal confidence
    std::stable_sort(result.begin(), result.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                         return a.confidence > b.confidence;
                     });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

// ============================================================================
// Settings
// ============================================================================

EngineSettings DecisionEngine::clamp_settings(const EngineSettings& settings) {
    require_finite(settings.consensus_threshold, "consensus_threshold");
    require_finite(settings.base_stop_loss_pct, "base_stop_loss_pct");
    require_finite(settings.base_take_profit_pct, "base_take_profit_pct");

    EngineSettings clamped;
    clamped.consensus_threshold = std::clamp(settings.consensus_threshold,
                                             limits::MIN_CONSENSUS_THRESHOLD,
                                             limits::MAX_CONSENSUS_THRESHOLD);
    clamped.base_stop_loss_pct = std::clamp(settings.base_stop_loss_pct,
                                            limits::MIN_STOP_LOSS_PCT, limits::MAX_STOP_LOSS_PCT);
    clamped.base_take_profit_pct = std::clamp(settings.base_take_profit_pct,
                                              limits::MIN_TAKE_PROFIT_PCT,
                                              limits::MAX_TAKE_PROFIT_PCT);
    return clamped;
}

EngineSettings DecisionEngine::update_settings(const EngineSettings& settings) {
    require_initialized("update_settings");
    const EngineSettings clamped = clamp_settings(settings);

    {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_ = clamped;
    }

    LOG_INFO("Settings updated: threshold {:.2f}, stop loss {:.3f}, take profit {:.3f}",
             clamped.consensus_threshold, clamped.base_stop_loss_pct, clamped.base_take_profit_pct);
    return clamped;
}

EngineSettings DecisionEngine::settings() const {
    require_initialized("settings");
    std::lock_guard<std::mutex> lock(settings_mutex_);
    return settings_;
}

strategy::StrategyRegistry& DecisionEngine::strategy_registry() {
    require_initialized("strategy_registry");
    return registry_;
}

}  // namespace tradeforce::engine
