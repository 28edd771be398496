#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Watchlist
// ============================================================================
// Ordered, duplicate-free set of asset identifiers. Thread-safe.
// ============================================================================

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace tradeforce::engine {

class Watchlist {
public:
    Watchlist() = default;

    Watchlist(const Watchlist&) = delete;
    Watchlist& operator=(const Watchlist&) = delete;

    /// Idempotent insert. Throws EngineError{InvalidInput} for an empty asset.
    bool add(const std::string& asset);

    /// False if the asset was not listed. Throws EngineError{InvalidInput} for an empty asset.
    bool remove(const std::string& asset);

    [[nodiscard]] bool contains(const std::string& asset) const;

    /// Snapshot in insertion order
    [[nodiscard]] std::vector<std::string> list() const;

    [[nodiscard]] size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_set<std::string> members_;
};

}  // namespace tradeforce::engine
