// ============================================================================
// TRADEFORCE ENGINE - Watchlist Implementation
// ============================================================================

#include "tradeforce/engine/watchlist.hpp"
#include "tradeforce/core/error.hpp"

#include <algorithm>

namespace tradeforce::engine {

namespace {

void require_asset(const std::string& asset) {
    if (asset.empty()) {
        throw EngineError(ErrorCode::InvalidInput, "Asset identifier must not be empty");
    }
}

}  // namespace

bool Watchlist::add(const std::string& asset) {
    require_asset(asset);

    std::lock_guard<std::mutex> lock(mutex_);
    if (members_.insert(asset).second) {
        order_.push_back(asset);
    }
    return true;
}

bool Watchlist::remove(const std::string& asset) {
    require_asset(asset);

    std::lock_guard<std::mutex> lock(mutex_);
    if (members_.erase(asset) == 0) {
        return false;
    }
    order_.erase(std::find(order_.begin(), order_.end(), asset));
    return true;
}

bool Watchlist::contains(const std::string& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.contains(asset);
}

std::vector<std::string> Watchlist::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t Watchlist::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

void Watchlist::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    members_.clear();
}

}  // namespace tradeforce::engine
