#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Trade Execution
// ============================================================================
// Boundary to order routing. The engine only produces recommendations;
// callers convert actionable ones into OrderRequests and hand them to an
// executor. PaperTradeExecutor acknowledges without routing anything.
// ============================================================================

#include "tradeforce/core/types.hpp"
#include "tradeforce/engine/recommendation.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tradeforce::order {

struct OrderRequest {
    std::string asset;
    Side side = Side::Buy;
    double quantity = 0.0;
    double notional = 0.0;
    double entry_price = 0.0;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;
};

struct ExecutionResult {
    bool success = false;
    std::string order_id;
    std::string message;
};

/// Bracket request for a directional recommendation with a position;
/// std::nullopt for hold, failed or zero-quantity recommendations
[[nodiscard]] std::optional<OrderRequest> make_order_request(const engine::Recommendation& rec);

class ITradeExecutor {
public:
    virtual ~ITradeExecutor() = default;

    virtual ExecutionResult execute(const OrderRequest& request) = 0;
};

class PaperTradeExecutor : public ITradeExecutor {
public:
    PaperTradeExecutor() = default;

    ExecutionResult execute(const OrderRequest& request) override;

    /// Every accepted request, in execution order
    [[nodiscard]] std::vector<OrderRequest> history() const;

private:
    std::string generate_order_id();

    mutable std::mutex mutex_;
    std::vector<OrderRequest> history_;
    std::atomic<uint64_t> order_counter_{0};
};

}  // namespace tradeforce::order
