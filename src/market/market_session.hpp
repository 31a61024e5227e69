#pragma once

#include <string_view>

namespace moverwatch {

enum class MarketState {
    Closed,
    Open
};

[[nodiscard]] constexpr std::string_view to_string(MarketState state) noexcept {
    switch (state) {
        case MarketState::Closed: return "CLOSED";
        case MarketState::Open:   return "OPEN";
    }
    return "UNKNOWN";
}

/// Edge reported by MarketSession::update
enum class SessionTransition {
    None,
    Opened,
    Closed
};

/// OPEN/CLOSED state plus the once-per-session startup notice flag.
/// Starts CLOSED so the first in-session check reports Opened.
class MarketSession {
public:
    /// Feed the latest clock reading
    /// @param active Result of MarketClock::is_active
    /// @return Transition caused by this reading
    SessionTransition update(bool active) noexcept;

    [[nodiscard]] MarketState state() const noexcept { return state_; }
    [[nodiscard]] bool is_open() const noexcept { return state_ == MarketState::Open; }

    /// True while open and the startup notice has not been sent yet
    [[nodiscard]] bool startup_notice_pending() const noexcept;

    void mark_startup_notice_sent() noexcept;

private:
    MarketState state_{MarketState::Closed};
    bool startup_notice_sent_{false};
};

}  // namespace moverwatch
