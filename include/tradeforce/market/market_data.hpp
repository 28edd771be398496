#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Market Data Contract
// ============================================================================
// OHLCV series for one asset / timeframe, oldest value first
// ============================================================================

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tradeforce::market {

struct MarketData {
    std::optional<double> price;  // Explicit current price
    std::vector<double> open;
    std::vector<double> high;
    std::vector<double> low;
    std::vector<double> close;
    std::vector<double> volume;

    [[nodiscard]] std::optional<double> last_close() const {
        if (close.empty()) return std::nullopt;
        return close.back();
    }
};

struct MarketDataResult {
    bool success = false;
    MarketData data;
    std::string error;

    static MarketDataResult ok(MarketData data) {
        return MarketDataResult{true, std::move(data), {}};
    }

    static MarketDataResult failure(std::string error) {
        return MarketDataResult{false, {}, std::move(error)};
    }
};

/// Market data collaborator. May throw; a throw is treated like success == false.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual MarketDataResult get_market_data(const std::string& asset,
                                             const std::string& timeframe) = 0;
};

}  // namespace tradeforce::market
