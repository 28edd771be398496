#pragma once
// ============================================================================
// TRADEFORCE ENGINE - JSON Market Data Provider
// ============================================================================
// File-backed market data snapshot:
//   {"assets": {"<asset>": {"<timeframe>": {"price": n, "open": [...],
//     "high": [...], "low": [...], "close": [...], "volume": [...]}}}}
// Every field of a series is optional. Parsed once at construction.
// ============================================================================

#include "tradeforce/market/market_data.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tradeforce::market {

class JsonMarketDataProvider : public IMarketDataProvider {
public:
    /// Throws EngineError{InvalidInput} if the file cannot be read or parsed
    explicit JsonMarketDataProvider(const std::string& path);

    /// Parse an in-memory document (same format as the file)
    [[nodiscard]] static JsonMarketDataProvider from_string(std::string_view json);

    MarketDataResult get_market_data(const std::string& asset,
                                     const std::string& timeframe) override;

    [[nodiscard]] std::vector<std::string> assets() const;
    [[nodiscard]] size_t series_count() const;

private:
    JsonMarketDataProvider() = default;

    void parse(std::string_view json, const std::string& source);

    using TimeframeMap = std::unordered_map<std::string, MarketData>;
    std::unordered_map<std::string, TimeframeMap> snapshots_;
};

}  // namespace tradeforce::market
