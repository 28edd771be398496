// ============================================================================
// TRADEFORCE ENGINE - Default Strategies Implementation
// ============================================================================

#include "tradeforce/strategy/strategy.hpp"
#include "tradeforce/strategy/indicators/bollinger.hpp"
#include "tradeforce/strategy/indicators/ema.hpp"
#include "tradeforce/strategy/indicators/ichimoku.hpp"
#include "tradeforce/strategy/indicators/macd.hpp"
#include "tradeforce/strategy/indicators/rsi.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace tradeforce::strategy {

namespace {

/// Integer parameter (period, displacement) read from the double map
size_t count_param(const StrategyParams& params, const std::string& key,
                   double fallback, double minimum) {
    const double value = param(params, key, fallback);
    if (!std::isfinite(value) || value < minimum) {
        throw std::invalid_argument("Invalid parameter " + key + ": " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

const std::vector<double>& require_closes(const market::MarketData& data, size_t required,
                                          const char* strategy) {
    if (data.close.size() < required) {
        throw std::invalid_argument(std::string("Not enough price data for ") + strategy +
                                    ": need " + std::to_string(required) + ", have " +
                                    std::to_string(data.close.size()));
    }
    return data.close;
}

/// Direction from the sign, confidence from the magnitude (0.5 when neutral)
StrategyResult to_result(SignalStrength strength) {
    if (strength.is_neutral()) {
        return StrategyResult{Signal::Hold, 0.5};
    }
    return StrategyResult{strength.direction(), std::abs(strength.value())};
}

template <typename MovingAverage>
SignalStrength crossover_strength(const std::vector<double>& closes, size_t fast_period,
                                  size_t slow_period) {
    MovingAverage fast{fast_period};
    MovingAverage slow{slow_period};
    double prev_diff = 0.0;

    for (double close : closes) {
        if (slow.is_ready()) {
            prev_diff = fast.value() - slow.value();
        }
        fast.update(close);
        slow.update(close);
    }

    const double diff = fast.value() - slow.value();
    if (prev_diff <= 0.0 && diff > 0.0) return SignalStrength{0.8};
    if (prev_diff >= 0.0 && diff < 0.0) return SignalStrength{-0.8};
    if (diff > 0.0) return SignalStrength{0.4};
    if (diff < 0.0) return SignalStrength{-0.4};
    return SignalStrength{0.0};
}

}  // namespace

// ============================================================================
// Moving Average Crossover
// ============================================================================

StrategyResult moving_average_crossover(const market::MarketData& data,
                                        const StrategyParams& params) {
    const size_t fast_period = count_param(params, "fastPeriod", 9, 1);
    const size_t slow_period = count_param(params, "slowPeriod", 21, 1);
    if (fast_period >= slow_period) {
        throw std::invalid_argument("fastPeriod must be less than slowPeriod");
    }

    const auto& closes = require_closes(data, slow_period + 1, "movingAverageCrossover");
    const bool use_ema = param(params, "useEma", 1.0) != 0.0;

    return to_result(use_ema ? crossover_strength<EMA>(closes, fast_period, slow_period)
                             : crossover_strength<SMA>(closes, fast_period, slow_period));
}

// ============================================================================
// MACD
// ============================================================================

StrategyResult macd_strategy(const market::MarketData& data, const StrategyParams& params) {
    const size_t fast_period = count_param(params, "fastPeriod", 12, 1);
    const size_t slow_period = count_param(params, "slowPeriod", 26, 1);
    const size_t signal_period = count_param(params, "signalPeriod", 9, 1);
    const bool use_histogram = param(params, "useHistogram", 1.0) != 0.0;

    MACD macd(fast_period, slow_period, signal_period);
    const auto& closes = require_closes(data, macd.period(), "macdStrategy");

    for (double close : closes) {
        macd.update(close);
    }
    return to_result(macd.signal(use_histogram));
}

// ============================================================================
// RSI Oscillator
// ============================================================================

StrategyResult rsi_oscillator(const market::MarketData& data, const StrategyParams& params) {
    RSI rsi(count_param(params, "period", 14, 1),
            param(params, "overbought", RSI::DEFAULT_OVERBOUGHT),
            param(params, "oversold", RSI::DEFAULT_OVERSOLD));
    const auto& closes = require_closes(data, rsi.period() + 1, "rsiOscillator");

    for (double close : closes) {
        rsi.update(close);
    }
    return to_result(rsi.signal());
}

// ============================================================================
// Bollinger Band Reversion
// ============================================================================

StrategyResult bollinger_band_reversion(const market::MarketData& data,
                                        const StrategyParams& params) {
    BollingerBands bands(count_param(params, "period", 20, 2), param(params, "stdDev", 2.0));
    const auto& closes = require_closes(data, bands.period(), "bollingerBandReversion");

    for (double close : closes) {
        bands.update(close);
    }
    return to_result(bands.signal());
}

// ============================================================================
// Ichimoku Cloud
// ============================================================================

StrategyResult ichimoku_cloud(const market::MarketData& data, const StrategyParams& params) {
    IchimokuCloud cloud(count_param(params, "conversionPeriod", 9, 1),
                        count_param(params, "basePeriod", 26, 1),
                        count_param(params, "laggingSpanPeriod", 52, 1),
                        count_param(params, "displacement", 26, 0));
    const auto& closes = require_closes(data, cloud.period(), "ichimokuCloud");

    // Series without highs/lows degrade to close-only bars
    const bool has_range = data.high.size() == closes.size() && data.low.size() == closes.size();

    for (size_t i = 0; i < closes.size(); ++i) {
        if (has_range) {
            cloud.update_bar(data.high[i], data.low[i], closes[i]);
        } else {
            cloud.update(closes[i]);
        }
    }
    return to_result(cloud.signal());
}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<StrategyFn> default_strategy_fn(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::MovingAverageCrossover: return StrategyFn{moving_average_crossover};
        case StrategyKind::Macd:                   return StrategyFn{macd_strategy};
        case StrategyKind::RsiOscillator:          return StrategyFn{rsi_oscillator};
        case StrategyKind::BollingerReversion:     return StrategyFn{bollinger_band_reversion};
        case StrategyKind::IchimokuCloud:          return StrategyFn{ichimoku_cloud};
        case StrategyKind::Custom:                 return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace tradeforce::strategy
