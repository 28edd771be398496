#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Bollinger Bands
// ============================================================================
// Volatility indicator using standard deviation bands
// Default: 20-period SMA with 2 standard deviation bands
// ============================================================================

#include "indicator_base.hpp"
#include "tradeforce/core/types.hpp"

#include <cmath>
#include <stdexcept>

namespace tradeforce::strategy {

class BollingerBands : public IndicatorBase<BollingerBands> {
public:
    explicit BollingerBands(size_t period = 20, double std_dev_multiplier = 2.0)
        : window_(period), multiplier_(std_dev_multiplier) {
        if (!(multiplier_ > 0.0)) {
            throw std::invalid_argument("Bollinger std dev multiplier must be positive");
        }
    }

    void update_impl(double price) {
        window_.push(price);
        latest_price_ = price;
        ++count_;

        if (count_ >= window_.capacity()) {
            middle_ = window_.mean();
            std_dev_ = window_.std_dev();
            upper_ = middle_ + multiplier_ * std_dev_;
            lower_ = middle_ - multiplier_ * std_dev_;
        }
    }

    /// Middle band (SMA)
    [[nodiscard]] double value_impl() const { return middle_; }

    [[nodiscard]] double upper_band() const { return upper_; }
    [[nodiscard]] double lower_band() const { return lower_; }

    /// Band width (volatility measure)
    [[nodiscard]] double band_width() const {
        if (middle_ == 0.0) return 0.0;
        return (upper_ - lower_) / middle_;
    }

    /// %B indicator: where price is relative to bands
    /// 0 = at lower band, 0.5 = at middle, 1 = at upper band
    [[nodiscard]] double percent_b() const {
        if (upper_ == lower_) return 0.5;
        return (latest_price_ - lower_) / (upper_ - lower_);
    }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= window_.capacity(); }

    void reset_impl() {
        window_.reset();
        count_ = 0;
        middle_ = 0.0;
        upper_ = 0.0;
        lower_ = 0.0;
        std_dev_ = 0.0;
        latest_price_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return window_.capacity(); }

    [[nodiscard]] bool is_at_upper() const {
        return is_ready_impl() && latest_price_ >= upper_;
    }

    [[nodiscard]] bool is_at_lower() const {
        return is_ready_impl() && latest_price_ <= lower_;
    }

    /// Mean reversion: outside the bands = 0.8, inner 20% of band = 0.4
    [[nodiscard]] SignalStrength signal() const {
        if (!is_ready_impl()) return SignalStrength{0.0};

        const double pct_b = percent_b();

        if (pct_b <= 0.0) {
            return SignalStrength{0.8};
        } else if (pct_b >= 1.0) {
            return SignalStrength{-0.8};
        } else if (pct_b < 0.2) {
            return SignalStrength{0.4};
        } else if (pct_b > 0.8) {
            return SignalStrength{-0.4};
        }

        return SignalStrength{0.0};
    }

private:
    RollingWindow window_;
    double multiplier_;
    size_t count_ = 0;
    double middle_ = 0.0;
    double upper_ = 0.0;
    double lower_ = 0.0;
    double std_dev_ = 0.0;
    double latest_price_ = 0.0;
};

static_assert(Indicator<BollingerBands>);

}  // namespace tradeforce::strategy
