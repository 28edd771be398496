#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Decision Engine
// ============================================================================
// Orchestrates one analysis per call:
//   [Provider] --fetch--> [Aggregator: N strategies] --consensus--> [Risk]
//                                                                     │
//                                                              Recommendation
// The engine owns the watchlist, the strategy registry and the most recent
// Recommendation per asset. Strategies run sequentially on the caller thread.
// ============================================================================

#include "tradeforce/engine/consensus_aggregator.hpp"
#include "tradeforce/engine/recommendation.hpp"
#include "tradeforce/engine/watchlist.hpp"
#include "tradeforce/market/market_data.hpp"
#include "tradeforce/risk/risk_calculator.hpp"
#include "tradeforce/strategy/strategy_registry.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeforce::engine {

// ============================================================================
// Configuration
// ============================================================================

struct EngineConfig {
    double consensus_threshold = 0.7;
    std::string default_timeframe = "1h";

    // Used when market data has neither a price nor a close; flagged as degraded
    double fallback_price = 0.0;

    // 0 = fetch synchronously without a timeout
    int64_t market_data_timeout_ms = 5000;

    // Skip strategies whose timeframes do not include the requested one
    bool enforce_timeframes = false;
};

/// Runtime-adjustable settings, clamped on update
struct EngineSettings {
    double consensus_threshold = 0.7;
    double base_stop_loss_pct = 0.02;
    double base_take_profit_pct = 0.05;
};

namespace limits {
    constexpr double MIN_CONSENSUS_THRESHOLD = 0.5;
    constexpr double MAX_CONSENSUS_THRESHOLD = 0.9;
    constexpr double MIN_STOP_LOSS_PCT = 0.005;
    constexpr double MAX_STOP_LOSS_PCT = 0.1;
    constexpr double MIN_TAKE_PROFIT_PCT = 0.01;
    constexpr double MAX_TAKE_PROFIT_PCT = 0.3;
}

// ============================================================================
// Decision Engine
// ============================================================================

class DecisionEngine {
public:
    explicit DecisionEngine(std::shared_ptr<market::IMarketDataProvider> provider,
                            EngineConfig config = EngineConfig{},
                            risk::RiskConfig risk_config = risk::RiskConfig{});

    DecisionEngine(const DecisionEngine&) = delete;
    DecisionEngine& operator=(const DecisionEngine&) = delete;

    /// Load the default strategy set. Safe to call again.
    bool initialize();
    [[nodiscard]] bool is_initialized() const { return initialized_.load(); }

    // ========================================================================
    // Analysis (never throws)
    // ========================================================================

    /// Empty timeframe = default_timeframe, empty keys = every registered strategy
    [[nodiscard]] Recommendation analyze_asset(const std::string& asset,
                                               const std::string& timeframe = {},
                                               const std::vector<std::string>& strategy_keys = {});

    /// analyze_asset for every watchlist entry, in watchlist order
    [[nodiscard]] std::vector<Recommendation> analyze_watchlist(
        const std::string& timeframe = {},
        const std::vector<std::string>& strategy_keys = {});

    // ========================================================================
    // Watchlist (throws NotInitialized / InvalidInput)
    // ========================================================================

    bool add_to_watchlist(const std::string& asset);
    bool remove_from_watchlist(const std::string& asset);
    [[nodiscard]] std::vector<std::string> get_watchlist() const;
    [[nodiscard]] bool is_watched(const std::string& asset) const;

    // ========================================================================
    // Retained Recommendations
    // ========================================================================

    [[nodiscard]] std::optional<Recommendation> last_recommendation(const std::string& asset) const;

    /// Actionable retained recommendations, highest confidence first
    [[nodiscard]] std::vector<Recommendation> recommendations(size_t limit = 5,
                                                              double min_confidence = 0.7) const;

    // ========================================================================
    // Settings
    // ========================================================================

    /// Returns the settings actually applied after clamping
    EngineSettings update_settings(const EngineSettings& settings);
    [[nodiscard]] EngineSettings settings() const;

    [[nodiscard]] strategy::StrategyRegistry& strategy_registry();
    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    void require_initialized(const char* operation) const;

    market::MarketDataResult fetch(const std::string& asset, const std::string& timeframe);

    void transition(Recommendation& rec, AnalysisState next) const;
    Recommendation fail(Recommendation rec, ErrorCode code, const std::string& message) const;
    void retain(const Recommendation& rec);

    static EngineSettings clamp_settings(const EngineSettings& settings);

    std::shared_ptr<market::IMarketDataProvider> provider_;
    EngineConfig config_;
    std::atomic<bool> initialized_{false};

    strategy::StrategyRegistry registry_;
    Watchlist watchlist_;

    mutable std::mutex settings_mutex_;
    EngineSettings settings_;
    risk::RiskConfig risk_config_;

    mutable std::mutex recommendations_mutex_;
    std::map<std::string, Recommendation> last_recommendations_;
};

}  // namespace tradeforce::engine
