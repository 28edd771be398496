#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Strategy Registry
// ============================================================================
// Named strategy configurations bound to their strategy functions.
// Entries are created at initialization and reconfigured in place,
// never removed during a session. Thread-safe.
// ============================================================================

#include "tradeforce/strategy/strategy.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradeforce::strategy {

struct StrategyConfig {
    std::string key;
    std::string name;
    bool enabled = true;
    StrategyParams params;
    std::vector<std::string> timeframes;  // Informational unless the engine enforces them
    double weight = 0.2;                  // [0, 1]

    [[nodiscard]] bool supports_timeframe(const std::string& timeframe) const;
};

/// Registry entry as seen by the aggregator
struct StrategyEntry {
    StrategyConfig config;
    StrategyKind kind = StrategyKind::Custom;
    StrategyFn fn;
};

class StrategyRegistry {
public:
    StrategyRegistry() = default;

    StrategyRegistry(const StrategyRegistry&) = delete;
    StrategyRegistry& operator=(const StrategyRegistry&) = delete;

    /// Register a strategy with its function.
    /// Throws EngineError{InvalidInput} on empty/duplicate key, bad weight or empty function.
    void register_strategy(StrategyConfig config, StrategyFn fn);

    /// Register a built-in strategy; the function is resolved from the key
    void register_builtin(StrategyConfig config);

    /// Register every default strategy whose key is not registered yet
    void load_defaults();

    /// Replace the configuration of an existing key (the function is kept)
    void configure(const std::string& key, StrategyConfig config);

    void set_enabled(const std::string& key, bool enabled);
    void set_weight(const std::string& key, double weight);
    void set_params(const std::string& key, StrategyParams params);

    [[nodiscard]] std::optional<StrategyConfig> find(const std::string& key) const;
    [[nodiscard]] std::optional<StrategyKind> kind(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;

    /// Keys in registration order
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Copies of the selected entries in selection order.
    /// Empty selection = all entries in registration order.
    /// Unknown keys are logged and skipped.
    [[nodiscard]] std::vector<StrategyEntry> snapshot(const std::vector<std::string>& selection = {}) const;

    [[nodiscard]] size_t size() const;

    /// The five built-in configurations, equal weight 0.2
    [[nodiscard]] static std::vector<StrategyConfig> default_configs();

private:
    StrategyEntry& entry_locked(const std::string& key);

    mutable std::mutex mutex_;
    std::vector<StrategyEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace tradeforce::strategy
