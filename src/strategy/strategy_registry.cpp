// ============================================================================
// TRADEFORCE ENGINE - Strategy Registry Implementation
// ============================================================================

#include "tradeforce/strategy/strategy_registry.hpp"
#include "tradeforce/core/error.hpp"
#include "tradeforce/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tradeforce::strategy {

namespace {

void validate_weight(const std::string& key, double weight) {
    if (!std::isfinite(weight) || weight < 0.0 || weight > 1.0) {
        throw EngineError(ErrorCode::InvalidInput,
                          "Strategy " + key + ": weight must be within [0, 1]");
    }
}

}  // namespace

bool StrategyConfig::supports_timeframe(const std::string& timeframe) const {
    return std::find(timeframes.begin(), timeframes.end(), timeframe) != timeframes.end();
}

// ============================================================================
// Registration
// ============================================================================

void StrategyRegistry::register_strategy(StrategyConfig config, StrategyFn fn) {
    if (config.key.empty()) {
        throw EngineError(ErrorCode::InvalidInput, "Strategy key must not be empty");
    }
    if (!fn) {
        throw EngineError(ErrorCode::InvalidInput, "Strategy " + config.key + " has no function");
    }
    validate_weight(config.key, config.weight);

    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.contains(config.key)) {
        throw EngineError(ErrorCode::InvalidInput, "Strategy already registered: " + config.key);
    }

    const auto kind = strategy_kind_from_key(config.key);
    LOG_DEBUG("Registered strategy {} (weight {:.2f}, {})", config.key, config.weight,
              config.enabled ? "enabled" : "disabled");

    index_.emplace(config.key, entries_.size());
    entries_.push_back(StrategyEntry{std::move(config), kind, std::move(fn)});
}

void StrategyRegistry::register_builtin(StrategyConfig config) {
    auto fn = default_strategy_fn(strategy_kind_from_key(config.key));
    if (!fn) {
        throw EngineError(ErrorCode::InvalidInput, "Not a built-in strategy: " + config.key);
    }
    register_strategy(std::move(config), std::move(*fn));
}

void StrategyRegistry::load_defaults() {
    for (auto& config : default_configs()) {
        if (contains(config.key)) continue;
        register_builtin(std::move(config));
    }
}

// ============================================================================
// Reconfiguration
// ============================================================================

StrategyEntry& StrategyRegistry::entry_locked(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw EngineError(ErrorCode::InvalidInput, "Unknown strategy: " + key);
    }
    return entries_[it->second];
}

void StrategyRegistry::configure(const std::string& key, StrategyConfig config) {
    if (config.key.empty()) {
        config.key = key;
    }
    if (config.key != key) {
        throw EngineError(ErrorCode::InvalidInput,
                          "Strategy key cannot change: " + key + " -> " + config.key);
    }
    validate_weight(key, config.weight);

    std::lock_guard<std::mutex> lock(mutex_);
    entry_locked(key).config = std::move(config);
}

void StrategyRegistry::set_enabled(const std::string& key, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_locked(key).config.enabled = enabled;
}

void StrategyRegistry::set_weight(const std::string& key, double weight) {
    validate_weight(key, weight);
    std::lock_guard<std::mutex> lock(mutex_);
    entry_locked(key).config.weight = weight;
}

void StrategyRegistry::set_params(const std::string& key, StrategyParams params) {
    std::lock_guard<std::mutex> lock(mutex_);
    entry_locked(key).config.params = std::move(params);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<StrategyConfig> StrategyRegistry::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].config;
}

std::optional<StrategyKind> StrategyRegistry::kind(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].kind;
}

bool StrategyRegistry::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.contains(key);
}

std::vector<std::string> StrategyRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.config.key);
    }
    return result;
}

std::vector<StrategyEntry> StrategyRegistry::snapshot(const std::vector<std::string>& selection) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (selection.empty()) {
        return entries_;
    }

    std::vector<StrategyEntry> result;
    result.reserve(selection.size());
    for (const auto& key : selection) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            LOG_WARN("Unknown strategy key '{}' ignored", key);
            continue;
        }
        result.push_back(entries_[it->second]);
    }
    return result;
}

size_t StrategyRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// Defaults
// ============================================================================

std::vector<StrategyConfig> StrategyRegistry::default_configs() {
    const std::vector<std::string> all_timeframes{"1h", "4h", "1d"};

    return {
        {"movingAverageCrossover", "Moving Average Crossover", true,
         {{"fastPeriod", 9}, {"slowPeriod", 21}, {"useEma", 1}},
         all_timeframes, 0.2},
        {"macdStrategy", "MACD Strategy", true,
         {{"fastPeriod", 12}, {"slowPeriod", 26}, {"signalPeriod", 9}, {"useHistogram", 1}},
         all_timeframes, 0.2},
        {"rsiOscillator", "RSI Oscillator", true,
         {{"period", 14}, {"overbought", 70}, {"oversold", 30}},
         all_timeframes, 0.2},
        {"bollingerBandReversion", "Bollinger Band Reversion", true,
         {{"period", 20}, {"stdDev", 2}},
         all_timeframes, 0.2},
        {"ichimokuCloud", "Ichimoku Cloud", true,
         {{"conversionPeriod", 9}, {"basePeriod", 26}, {"laggingSpanPeriod", 52}, {"displacement", 26}},
         {"4h", "1d"}, 0.2},
    };
}

}  // namespace tradeforce::strategy
