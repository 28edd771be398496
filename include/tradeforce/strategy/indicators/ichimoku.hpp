#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Ichimoku Cloud
// ============================================================================
// Tenkan-sen / Kijun-sen with Senkou spans displaced forward
// Default: 9 / 26 / 52, displacement 26
// ============================================================================

#include "indicator_base.hpp"
#include "tradeforce/core/types.hpp"

#include <algorithm>

namespace tradeforce::strategy {

class IchimokuCloud : public IndicatorBase<IchimokuCloud> {
public:
    explicit IchimokuCloud(size_t conversion_period = 9,
                           size_t base_period = 26,
                           size_t span_b_period = 52,
                           size_t displacement = 26)
        : conv_high_(conversion_period), conv_low_(conversion_period),
          base_high_(base_period), base_low_(base_period),
          span_b_high_(span_b_period), span_b_low_(span_b_period),
          span_a_history_(displacement + 1), span_b_history_(displacement + 1),
          displacement_(displacement) {}

    /// Close-only update (high = low = close)
    void update_impl(double price) { update_bar(price, price, price); }

    void update_bar(double high, double low, double close) {
        conv_high_.push(high);
        conv_low_.push(low);
        base_high_.push(high);
        base_low_.push(low);
        span_b_high_.push(high);
        span_b_low_.push(low);

        prev_tenkan_ = tenkan_;
        prev_kijun_ = kijun_;
        tenkan_ = (conv_high_.max() + conv_low_.min()) / 2.0;
        kijun_ = (base_high_.max() + base_low_.min()) / 2.0;

        span_a_history_.push((tenkan_ + kijun_) / 2.0);
        span_b_history_.push((span_b_high_.max() + span_b_low_.min()) / 2.0);

        latest_close_ = close;
        ++count_;
    }

    /// Conversion line (Tenkan-sen)
    [[nodiscard]] double value_impl() const { return tenkan_; }

    [[nodiscard]] double conversion_line() const { return tenkan_; }
    [[nodiscard]] double base_line() const { return kijun_; }

    /// Leading spans plotted at the current bar (computed `displacement` bars ago)
    [[nodiscard]] double leading_span_a() const { return span_a_history_[displacement_]; }
    [[nodiscard]] double leading_span_b() const { return span_b_history_[displacement_]; }

    [[nodiscard]] bool is_ready_impl() const {
        return count_ > 1 && count_ >= period_impl();
    }

    void reset_impl() {
        conv_high_.reset();
        conv_low_.reset();
        base_high_.reset();
        base_low_.reset();
        span_b_high_.reset();
        span_b_low_.reset();
        span_a_history_.reset();
        span_b_history_.reset();
        count_ = 0;
        tenkan_ = kijun_ = prev_tenkan_ = prev_kijun_ = 0.0;
        latest_close_ = 0.0;
    }

    /// Bars needed before the displaced spans cover full windows
    [[nodiscard]] size_t period_impl() const {
        return std::max({conv_high_.capacity(), base_high_.capacity(), span_b_high_.capacity()}) +
               displacement_;
    }

    [[nodiscard]] bool is_above_cloud() const {
        return is_ready_impl() && latest_close_ > std::max(leading_span_a(), leading_span_b());
    }

    [[nodiscard]] bool is_below_cloud() const {
        return is_ready_impl() && latest_close_ < std::min(leading_span_a(), leading_span_b());
    }

    /// TK cross confirmed by price and cloud colour = 0.9, trend alignment = 0.5
    [[nodiscard]] SignalStrength signal() const {
        if (!is_ready_impl()) return SignalStrength{0.0};

        const bool tk_cross_up = prev_tenkan_ <= prev_kijun_ && tenkan_ > kijun_;
        const bool tk_cross_down = prev_tenkan_ >= prev_kijun_ && tenkan_ < kijun_;
        const bool bullish_cloud = leading_span_a() > leading_span_b();
        const bool bearish_cloud = leading_span_a() < leading_span_b();

        if (tk_cross_up && is_above_cloud() && bullish_cloud) {
            return SignalStrength{0.9};
        }
        if (tk_cross_down && is_below_cloud() && bearish_cloud) {
            return SignalStrength{-0.9};
        }
        if (is_above_cloud() && tenkan_ > kijun_) {
            return SignalStrength{0.5};
        }
        if (is_below_cloud() && tenkan_ < kijun_) {
            return SignalStrength{-0.5};
        }
        return SignalStrength{0.0};
    }

private:
    RollingWindow conv_high_;
    RollingWindow conv_low_;
    RollingWindow base_high_;
    RollingWindow base_low_;
    RollingWindow span_b_high_;
    RollingWindow span_b_low_;
    RollingWindow span_a_history_;
    RollingWindow span_b_history_;

    size_t displacement_;
    size_t count_ = 0;
    double tenkan_ = 0.0;
    double kijun_ = 0.0;
    double prev_tenkan_ = 0.0;
    double prev_kijun_ = 0.0;
    double latest_close_ = 0.0;
};

static_assert(Indicator<IchimokuCloud>);

}  // namespace tradeforce::strategy
