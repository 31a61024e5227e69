#pragma once

#include "alert/alert_kind.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace moverwatch {

/// Cooldown gate keyed by (symbol, alert kind).
///
/// allow() both checks and records: a true result means the caller owns
/// this firing and must act on it (notify, add to watchlist); a false
/// result means the same kind already fired for the symbol within the
/// cooldown and nothing was changed.
class AlertLedger {
public:
    /// @param cooldown Minimum interval between two firings of one key
    explicit AlertLedger(std::chrono::seconds cooldown);

    /// Check and record a candidate firing
    /// @return true if allowed (timestamp recorded), false if suppressed
    [[nodiscard]] bool allow(const Symbol& symbol, AlertKind kind, WallTime now);

    /// Last recorded firing for a key
    [[nodiscard]] std::optional<WallTime> last_fired(const Symbol& symbol, AlertKind kind) const;

    /// Drop keys whose cooldown has elapsed at `now`
    /// @return Number of keys removed
    std::size_t prune(WallTime now);

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::chrono::seconds cooldown() const noexcept { return cooldown_; }

private:
    using Key = std::pair<Symbol, AlertKind>;

    std::chrono::seconds cooldown_;

    mutable std::mutex mutex_;
    std::map<Key, WallTime> fired_;
};

}  // namespace moverwatch
