#include "alert/alert_ledger.hpp"

namespace moverwatch {

AlertLedger::AlertLedger(std::chrono::seconds cooldown)
    : cooldown_(cooldown)
{}

bool AlertLedger::allow(const Symbol& symbol, AlertKind kind, WallTime now) {
    std::lock_guard lock(mutex_);

    auto [it, inserted] = fired_.try_emplace(Key{symbol, kind}, now);
    if (inserted) {
        return true;
    }

    if (now - it->second < cooldown_) {
        return false;
    }

    it->second = now;
    return true;
}

std::optional<WallTime> AlertLedger::last_fired(const Symbol& symbol, AlertKind kind) const {
    std::lock_guard lock(mutex_);

    auto it = fired_.find(Key{symbol, kind});
    if (it == fired_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AlertLedger::prune(WallTime now) {
    std::lock_guard lock(mutex_);

    std::size_t removed = 0;
    for (auto it = fired_.begin(); it != fired_.end();) {
        if (now - it->second >= cooldown_) {
            it = fired_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t AlertLedger::size() const {
    std::lock_guard lock(mutex_);
    return fired_.size();
}

}  // namespace moverwatch
