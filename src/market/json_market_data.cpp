// ============================================================================
// TRADEFORCE ENGINE - JSON Market Data Provider Implementation
// ============================================================================

#include "tradeforce/market/json_market_data.hpp"
#include "tradeforce/core/error.hpp"
#include "tradeforce/utils/logger.hpp"

#include <simdjson.h>

#include <algorithm>
#include <utility>

namespace tradeforce::market {

namespace {

void read_series(simdjson::ondemand::value value, std::vector<double>& out) {
    for (auto element : value.get_array()) {
        const double number = element.get_double();
        out.push_back(number);
    }
}

MarketData read_market_data(simdjson::ondemand::object series) {
    MarketData data;

    // On-demand is forward-only: dispatch on each key as it is reached
    for (auto field : series) {
        const std::string_view key = field.unescaped_key();

        if (key == "price") {
            const double price = field.value().get_double();
            data.price = price;
        } else if (key == "open") {
            read_series(field.value(), data.open);
        } else if (key == "high") {
            read_series(field.value(), data.high);
        } else if (key == "low") {
            read_series(field.value(), data.low);
        } else if (key == "close") {
            read_series(field.value(), data.close);
        } else if (key == "volume") {
            read_series(field.value(), data.volume);
        }
    }
    return data;
}

}  // namespace

JsonMarketDataProvider::JsonMarketDataProvider(const std::string& path) {
    simdjson::padded_string json;
    auto error = simdjson::padded_string::load(path).get(json);
    if (error) {
        throw EngineError(ErrorCode::InvalidInput,
                          "Cannot read market data file " + path + ": " +
                              simdjson::error_message(error));
    }
    parse(std::string_view(json.data(), json.size()), path);
}

JsonMarketDataProvider JsonMarketDataProvider::from_string(std::string_view json) {
    JsonMarketDataProvider provider;
    provider.parse(json, "<memory>");
    return provider;
}

void JsonMarketDataProvider::parse(std::string_view json, const std::string& source) {
    try {
        simdjson::padded_string padded(json);
        simdjson::ondemand::parser parser;
        auto doc = parser.iterate(padded);

        simdjson::ondemand::object assets = doc["assets"].get_object();
        for (auto asset_field : assets) {
            const std::string_view asset_key = asset_field.unescaped_key();
            const std::string asset(asset_key);

            simdjson::ondemand::object timeframes = asset_field.value().get_object();
            for (auto timeframe_field : timeframes) {
                const std::string_view timeframe_key = timeframe_field.unescaped_key();
                const std::string timeframe(timeframe_key);
                simdjson::ondemand::object series = timeframe_field.value().get_object();
                snapshots_[asset][timeframe] = read_market_data(series);
            }
        }
    } catch (const simdjson::simdjson_error& e) {
        throw EngineError(ErrorCode::InvalidInput,
                          "Malformed market data in " + source + ": " + e.what());
    }

    LOG_INFO("Loaded {} market data series for {} assets from {}", series_count(),
             snapshots_.size(), source);
}

MarketDataResult JsonMarketDataProvider::get_market_data(const std::string& asset,
                                                         const std::string& timeframe) {
    auto asset_it = snapshots_.find(asset);
    if (asset_it == snapshots_.end()) {
        return MarketDataResult::failure("No market data for asset " + asset);
    }

    auto series_it = asset_it->second.find(timeframe);
    if (series_it == asset_it->second.end()) {
        return MarketDataResult::failure("No " + timeframe + " market data for asset " + asset);
    }
    return MarketDataResult::ok(series_it->second);
}

std::vector<std::string> JsonMarketDataProvider::assets() const {
    std::vector<std::string> result;
    result.reserve(snapshots_.size());
    for (const auto& [asset, series] : snapshots_) {
        result.push_back(asset);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t JsonMarketDataProvider::series_count() const {
    size_t count = 0;
    for (const auto& [asset, series] : snapshots_) {
        count += series.size();
    }
    return count;
}

}  // namespace tradeforce::market
