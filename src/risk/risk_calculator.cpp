// ============================================================================
// TRADEFORCE ENGINE - Risk Parameter Calculator Implementation
// ============================================================================

#include "tradeforce/risk/risk_calculator.hpp"

#include <algorithm>
#include <cmath>

namespace tradeforce::risk {

RiskLevels RiskCalculator::calculate(Signal signal, double confidence, double current_price) const {
    RiskLevels levels;
    if (signal == Signal::Hold) {
        return levels;
    }

    const double sl_pct = stop_loss_percent(config_.base_stop_loss_pct, confidence);
    const double tp_pct = take_profit_percent(config_.base_take_profit_pct, confidence);

    if (signal == Signal::Buy) {
        levels.stop_loss = current_price * (1.0 - sl_pct);
        levels.take_profit = current_price * (1.0 + tp_pct);
    } else {
        levels.stop_loss = current_price * (1.0 + sl_pct);
        levels.take_profit = current_price * (1.0 - tp_pct);
    }

    // Undefined when there is no distance to the stop (zero price or zero stop percent)
    const double risk = std::abs(current_price - *levels.stop_loss);
    if (risk > 0.0) {
        levels.risk_reward = std::abs(*levels.take_profit - current_price) / risk;
    }

    levels.position = size_position(signal, confidence, current_price);
    return levels;
}

std::optional<PositionSize> RiskCalculator::size_position(Signal signal, double confidence,
                                                          double current_price) const {
    if (signal == Signal::Hold) {
        return std::nullopt;
    }

    PositionSize size;
    const double cap = config_.account_balance * config_.max_position_pct;
    size.notional = std::min(config_.account_balance * config_.risk_per_trade_pct * confidence, cap);
    size.notional = std::max(size.notional, 0.0);

    if (current_price > 0.0) {
        size.quantity = size.notional / current_price;
    }
    return size;
}

}  // namespace tradeforce::risk
