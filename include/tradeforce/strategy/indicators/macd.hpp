#pragma once
// ============================================================================
// TRADEFORCE ENGINE - MACD (Moving Average Convergence Divergence)
// ============================================================================
// Trend-following momentum indicator
// Standard settings: 12/26/9 EMAs
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"
#include "tradeforce/core/types.hpp"

#include <cmath>
#include <stdexcept>

namespace tradeforce::strategy {

class MACD : public IndicatorBase<MACD> {
public:
    explicit MACD(size_t fast_period = 12, size_t slow_period = 26, size_t signal_period = 9)
        : fast_ema_(fast_period), slow_ema_(slow_period), signal_ema_(signal_period),
          slow_period_(slow_period), signal_period_(signal_period) {
        if (fast_period >= slow_period) {
            throw std::invalid_argument("MACD fast period must be less than slow period");
        }
        reset_impl();
    }

    void update_impl(double price) {
        fast_ema_.update(price);
        slow_ema_.update(price);
        ++count_;

        if (count_ >= slow_period_) {
            macd_line_ = fast_ema_.value() - slow_ema_.value();

            // Signal line is the EMA of the MACD line
            signal_ema_.update(macd_line_);

            // Store previous for crossover detection
            prev_histogram_ = histogram_;
            histogram_ = macd_line_ - signal_ema_.value();
        }
    }

    /// MACD line (fast EMA - slow EMA)
    [[nodiscard]] double value_impl() const { return macd_line_; }

    [[nodiscard]] double signal_line() const { return signal_ema_.value(); }

    /// Histogram (MACD - Signal)
    [[nodiscard]] double histogram() const { return histogram_; }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ >= slow_period_ + signal_period_;
    }

    void reset_impl() {
        count_ = 0;
        macd_line_ = 0.0;
        histogram_ = 0.0;
        prev_histogram_ = 0.0;
        fast_ema_.reset();
        slow_ema_.reset();
        signal_ema_.reset();
    }

    [[nodiscard]] size_t period_impl() const { return slow_period_ + signal_period_; }

    // ========================================================================
    // Trading Signals
    // ========================================================================

    /// Bullish crossover: MACD crosses above signal line
    [[nodiscard]] bool is_bullish_crossover() const {
        return is_ready_impl() && prev_histogram_ <= 0.0 && histogram_ > 0.0;
    }

    /// Bearish crossover: MACD crosses below signal line
    [[nodiscard]] bool is_bearish_crossover() const {
        return is_ready_impl() && prev_histogram_ >= 0.0 && histogram_ < 0.0;
    }

    [[nodiscard]] bool is_bullish() const {
        return is_ready_impl() && macd_line_ > 0.0;
    }

    [[nodiscard]] bool is_bearish() const {
        return is_ready_impl() && macd_line_ < 0.0;
    }

    /// Histogram expanding (momentum increasing)
    [[nodiscard]] bool is_momentum_increasing() const {
        return is_ready_impl() && std::abs(histogram_) > std::abs(prev_histogram_);
    }

    /// Crossover = 0.8, expanding histogram = 0.4 when use_histogram is set
    [[nodiscard]] SignalStrength signal(bool use_histogram = true) const {
        if (!is_ready_impl()) return SignalStrength{0.0};

        if (is_bullish_crossover()) {
            return SignalStrength{0.8};
        }
        if (is_bearish_crossover()) {
            return SignalStrength{-0.8};
        }

        if (use_histogram) {
            if (histogram_ > 0.0 && is_momentum_increasing()) {
                return SignalStrength{0.4};
            }
            if (histogram_ < 0.0 && is_momentum_increasing()) {
                return SignalStrength{-0.4};
            }
        }

        return SignalStrength{0.0};
    }

private:
    EMA fast_ema_;
    EMA slow_ema_;
    EMA signal_ema_;

    size_t slow_period_;
    size_t signal_period_;
    size_t count_ = 0;
    double macd_line_ = 0.0;
    double histogram_ = 0.0;
    double prev_histogram_ = 0.0;
};

static_assert(Indicator<MACD>);

}  // namespace tradeforce::strategy
