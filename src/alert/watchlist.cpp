#include "alert/watchlist.hpp"

namespace moverwatch {

Watchlist::Watchlist(std::chrono::minutes ttl)
    : ttl_(ttl)
{}

bool Watchlist::add(const Symbol& symbol, WallTime now) {
    std::lock_guard lock(mutex_);

    auto [it, inserted] = entries_.insert_or_assign(symbol, now);
    return inserted;
}

bool Watchlist::contains(const Symbol& symbol) const {
    std::lock_guard lock(mutex_);
    return entries_.find(symbol) != entries_.end();
}

std::vector<Symbol> Watchlist::snapshot() const {
    std::lock_guard lock(mutex_);

    std::vector<Symbol> symbols;
    symbols.reserve(entries_.size());
    for (const auto& [symbol, added_at] : entries_) {
        symbols.push_back(symbol);
    }
    return symbols;
}

std::size_t Watchlist::expire(WallTime now) {
    std::lock_guard lock(mutex_);

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second >= ttl_) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t Watchlist::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace moverwatch
