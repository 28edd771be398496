#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Risk Parameter Calculator
// ============================================================================
// Stop-loss / take-profit levels scaled by consensus confidence:
//   stop_loss_pct   = base_sl * (1.5 - confidence)   (tighter when confident)
//   take_profit_pct = base_tp * confidence * 1.5     (wider when confident)
// ============================================================================

#include "tradeforce/core/types.hpp"

#include <optional>

namespace tradeforce::risk {

// ============================================================================
// Risk Configuration
// ============================================================================

struct RiskConfig {
    double base_stop_loss_pct = 0.02;    // 2%
    double base_take_profit_pct = 0.05;  // 5%

    // Position sizing
    double account_balance = 1000.0;
    double risk_per_trade_pct = 0.02;    // Notional at full confidence
    double max_position_pct = 0.05;      // Hard cap on notional
};

struct PositionSize {
    double quantity = 0.0;
    double notional = 0.0;
};

struct RiskLevels {
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
    std::optional<double> risk_reward;
    std::optional<PositionSize> position;
};

// ============================================================================
// Risk Calculator
// ============================================================================

class RiskCalculator {
public:
    explicit RiskCalculator(const RiskConfig& config = RiskConfig{}) : config_(config) {}

    /// Non-increasing in confidence
    [[nodiscard]] static double stop_loss_percent(double base_pct, double confidence) noexcept {
        return base_pct * (1.5 - confidence);
    }

    /// Non-decreasing in confidence
    [[nodiscard]] static double take_profit_percent(double base_pct, double confidence) noexcept {
        return base_pct * confidence * 1.5;
    }

    /// All levels empty for Hold
    [[nodiscard]] RiskLevels calculate(Signal signal, double confidence, double current_price) const;

    /// Empty for Hold. Quantity is 0 when the price is not positive.
    [[nodiscard]] std::optional<PositionSize> size_position(Signal signal, double confidence,
                                                            double current_price) const;

    [[nodiscard]] const RiskConfig& config() const { return config_; }
    void set_config(const RiskConfig& config) { config_ = config; }

private:
    RiskConfig config_;
};

}  // namespace tradeforce::risk
