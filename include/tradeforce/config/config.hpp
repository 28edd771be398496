#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Application Configuration
// ============================================================================
// YAML sections: engine, risk, strategies, watchlist, market_data,
// execution, logging. Missing keys keep their defaults.
// ============================================================================

#include "tradeforce/engine/decision_engine.hpp"
#include "tradeforce/risk/risk_calculator.hpp"
#include "tradeforce/strategy/strategy_registry.hpp"
#include "tradeforce/utils/logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradeforce::config {

/// Partial override of one registered strategy
struct StrategyOverride {
    std::string key;
    std::optional<bool> enabled;
    std::optional<double> weight;
    std::optional<std::vector<std::string>> timeframes;
    strategy::StrategyParams params;  // Merged over the existing params
};

struct AppConfig {
    engine::EngineConfig engine;
    risk::RiskConfig risk;
    std::vector<StrategyOverride> strategies;

    // SOL and USDC mints
    std::vector<std::string> watchlist{
        "So11111111111111111111111111111111111111112",
        "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"};

    std::string market_data_file = "data/market_snapshot.json";
    bool paper_trading = true;

    utils::LogConfig logging;
};

/// Throws ConfigError if the file is unreadable, malformed or out of range
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Same as load_config for an in-memory document
[[nodiscard]] AppConfig parse_config(const std::string& yaml);

/// Apply overrides to registered strategies. Throws ConfigError for unknown keys.
void apply_strategy_overrides(strategy::StrategyRegistry& registry,
                              const std::vector<StrategyOverride>& overrides);

}  // namespace tradeforce::config
