#pragma once

#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace moverwatch {

/// Symbols under secondary (large-sale) monitoring after a bid match.
/// Entries expire `ttl` after they were last added.
class Watchlist {
public:
    /// @param ttl Lifetime of an entry since its last add
    explicit Watchlist(std::chrono::minutes ttl);

    /// Add or refresh a symbol
    /// @return true if the symbol was not on the list
    bool add(const Symbol& symbol, WallTime now);

    [[nodiscard]] bool contains(const Symbol& symbol) const;

    /// Sorted copy of the current symbols, safe to iterate while others add
    [[nodiscard]] std::vector<Symbol> snapshot() const;

    /// Remove entries older than the ttl
    /// @return Number of symbols removed
    std::size_t expire(WallTime now);

    [[nodiscard]] std::size_t size() const;

private:
    std::chrono::minutes ttl_;

    mutable std::mutex mutex_;
    std::map<Symbol, WallTime> entries_;  // symbol -> last added
};

}  // namespace moverwatch
