#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Strategy Function Contract
// ============================================================================
// A strategy maps (market data, params) to a signal with a confidence.
// Throwing means the strategy abstains for this analysis.
// ============================================================================

#include "tradeforce/core/types.hpp"
#include "tradeforce/market/market_data.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tradeforce::strategy {

/// Named numeric parameters ("fastPeriod" -> 9)
using StrategyParams = std::map<std::string, double>;

struct StrategyResult {
    Signal signal = Signal::Hold;
    double confidence = 0.0;  // [0, 1]
};

using StrategyFn = std::function<StrategyResult(const market::MarketData&, const StrategyParams&)>;

/// Built-in strategies, resolved once from their registry key
enum class StrategyKind : uint8_t {
    MovingAverageCrossover,
    Macd,
    RsiOscillator,
    BollingerReversion,
    IchimokuCloud,
    Custom
};

[[nodiscard]] constexpr std::string_view to_string(StrategyKind kind) noexcept {
    switch (kind) {
        case StrategyKind::MovingAverageCrossover: return "movingAverageCrossover";
        case StrategyKind::Macd:                   return "macdStrategy";
        case StrategyKind::RsiOscillator:          return "rsiOscillator";
        case StrategyKind::BollingerReversion:     return "bollingerBandReversion";
        case StrategyKind::IchimokuCloud:          return "ichimokuCloud";
        case StrategyKind::Custom:                 return "custom";
    }
    return "custom";
}

/// Unknown keys resolve to Custom
[[nodiscard]] inline StrategyKind strategy_kind_from_key(std::string_view key) noexcept {
    if (key == "movingAverageCrossover") return StrategyKind::MovingAverageCrossover;
    if (key == "macdStrategy") return StrategyKind::Macd;
    if (key == "rsiOscillator") return StrategyKind::RsiOscillator;
    if (key == "bollingerBandReversion") return StrategyKind::BollingerReversion;
    if (key == "ichimokuCloud") return StrategyKind::IchimokuCloud;
    return StrategyKind::Custom;
}

/// Parameter lookup with default
[[nodiscard]] inline double param(const StrategyParams& params, const std::string& key,
                                  double fallback) {
    auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

// ============================================================================
// Default Strategies
// ============================================================================

StrategyResult moving_average_crossover(const market::MarketData& data, const StrategyParams& params);
StrategyResult macd_strategy(const market::MarketData& data, const StrategyParams& params);
StrategyResult rsi_oscillator(const market::MarketData& data, const StrategyParams& params);
StrategyResult bollinger_band_reversion(const market::MarketData& data, const StrategyParams& params);
StrategyResult ichimoku_cloud(const market::MarketData& data, const StrategyParams& params);

/// Function for a built-in kind; std::nullopt for Custom
[[nodiscard]] std::optional<StrategyFn> default_strategy_fn(StrategyKind kind);

}  // namespace tradeforce::strategy
