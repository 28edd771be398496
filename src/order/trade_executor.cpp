// ============================================================================
// TRADEFORCE ENGINE - Trade Execution Implementation
// ============================================================================

#include "tradeforce/order/trade_executor.hpp"
#include "tradeforce/utils/logger.hpp"

namespace tradeforce::order {

std::optional<OrderRequest> make_order_request(const engine::Recommendation& rec) {
    if (rec.signal == Signal::Hold || rec.failed() || !rec.position) {
        return std::nullopt;
    }
    if (rec.position->quantity <= 0.0) {
        return std::nullopt;
    }

    OrderRequest request;
    request.asset = rec.asset;
    request.side = rec.signal == Signal::Buy ? Side::Buy : Side::Sell;
    request.quantity = rec.position->quantity;
    request.notional = rec.position->notional;
    request.entry_price = rec.current_price;
    request.stop_loss = rec.stop_loss;
    request.take_profit = rec.take_profit;
    return request;
}

ExecutionResult PaperTradeExecutor::execute(const OrderRequest& request) {
    if (request.asset.empty() || !(request.quantity > 0.0)) {
        LOG_WARN("[PAPER] Rejected order for '{}': quantity {}", request.asset, request.quantity);
        return ExecutionResult{false, {}, "Invalid order request"};
    }

    const std::string order_id = generate_order_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(request);
    }

    LOG_INFO("[PAPER] {} {} {:.6f} @ {} (notional {:.2f}, SL {}, TP {}) -> {}",
             to_string(request.side), request.asset, request.quantity, request.entry_price,
             request.notional, request.stop_loss.value_or(0.0), request.take_profit.value_or(0.0),
             order_id);
    return ExecutionResult{true, order_id, "Paper order accepted"};
}

std::vector<OrderRequest> PaperTradeExecutor::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::string PaperTradeExecutor::generate_order_id() {
    return "paper_" + std::to_string(++order_counter_);
}

}  // namespace tradeforce::order
