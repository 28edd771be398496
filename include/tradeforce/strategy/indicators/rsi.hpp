#pragma once
// ============================================================================
// TRADEFORCE ENGINE - RSI (Relative Strength Index)
// ============================================================================
// Momentum oscillator measuring speed and magnitude of price changes
// Range: 0-100, Overbought > 70, Oversold < 30 by default
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tradeforce::strategy {

/// RSI Indicator with Wilder's smoothing
class RSI : public IndicatorBase<RSI> {
public:
    static constexpr double DEFAULT_OVERBOUGHT = 70.0;
    static constexpr double DEFAULT_OVERSOLD = 30.0;

    explicit RSI(size_t period = 14,
                 double overbought = DEFAULT_OVERBOUGHT,
                 double oversold = DEFAULT_OVERSOLD)
        : period_(require_period(period, "RSI")),
          overbought_(overbought),
          oversold_(oversold) {
        if (!(oversold_ > 0.0 && oversold_ < overbought_ && overbought_ < 100.0)) {
            throw std::invalid_argument("RSI thresholds must satisfy 0 < oversold < overbought < 100");
        }
        reset_impl();
    }

    void update_impl(double price) {
        if (count_ == 0) {
            prev_price_ = price;
            ++count_;
            return;
        }

        const double change = price - prev_price_;
        prev_price_ = price;
        ++count_;

        const double gain = std::max(change, 0.0);
        const double loss = std::max(-change, 0.0);
        const auto period = static_cast<double>(period_);

        if (count_ <= period_) {
            gain_sum_ += gain;
            loss_sum_ += loss;

            if (count_ == period_) {
                avg_gain_ = gain_sum_ / period;
                avg_loss_ = loss_sum_ / period;
            }
        } else {
            // Wilder's smoothing
            avg_gain_ = (avg_gain_ * (period - 1.0) + gain) / period;
            avg_loss_ = (avg_loss_ * (period - 1.0) + loss) / period;
        }
    }

    [[nodiscard]] double value_impl() const {
        if (!is_ready_impl()) return 50.0;  // Neutral value if not ready

        if (avg_loss_ == 0.0) {
            return avg_gain_ == 0.0 ? 50.0 : 100.0;  // Flat = neutral, all gains = max
        }

        const double rs = avg_gain_ / avg_loss_;
        return 100.0 - (100.0 / (1.0 + rs));
    }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ > period_;
    }

    void reset_impl() {
        count_ = 0;
        prev_price_ = 0.0;
        gain_sum_ = 0.0;
        loss_sum_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

    [[nodiscard]] bool is_overbought() const { return value_impl() > overbought_; }
    [[nodiscard]] bool is_oversold() const { return value_impl() < oversold_; }

    /// Strength grows with the distance past the threshold
    [[nodiscard]] SignalStrength signal() const {
        if (!is_ready_impl()) return SignalStrength{0.0};

        const double rsi = value_impl();

        if (rsi > overbought_) {
            return SignalStrength{-(rsi - overbought_) / (100.0 - overbought_)};
        } else if (rsi < oversold_) {
            return SignalStrength{(oversold_ - rsi) / oversold_};
        }
        return SignalStrength{0.0};
    }

private:
    size_t period_;
    double overbought_;
    double oversold_;
    size_t count_ = 0;
    double prev_price_ = 0.0;
    double gain_sum_ = 0.0;
    double loss_sum_ = 0.0;
    double avg_gain_ = 0.0;
    double avg_loss_ = 0.0;
};

static_assert(Indicator<RSI>);

}  // namespace tradeforce::strategy
