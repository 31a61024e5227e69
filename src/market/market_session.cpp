#include "market/market_session.hpp"

namespace moverwatch {

SessionTransition MarketSession::update(bool active) noexcept {
    if (active && state_ == MarketState::Closed) {
        state_ = MarketState::Open;
        return SessionTransition::Opened;
    }
    if (!active && state_ == MarketState::Open) {
        state_ = MarketState::Closed;
        // Next opening announces itself again
        startup_notice_sent_ = false;
        return SessionTransition::Closed;
    }
    return SessionTransition::None;
}

bool MarketSession::startup_notice_pending() const noexcept {
    return state_ == MarketState::Open && !startup_notice_sent_;
}

void MarketSession::mark_startup_notice_sent() noexcept {
    startup_notice_sent_ = true;
}

}  // namespace moverwatch
