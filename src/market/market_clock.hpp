#pragma once

#include "core/config.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <boost/date_time/local_time/local_time.hpp>
#include <string>

namespace moverwatch {

/// Decides whether the market is in session for a wall-clock instant.
/// Session = Monday to Friday, local hour in [open_hour, close_hour) of
/// the reference timezone. No holiday or half-day calendar.
class MarketClock {
public:
    using ZonePtr = boost::local_time::time_zone_ptr;

    /// Create a clock for a parsed zone
    /// @param zone Reference timezone
    /// @param open_hour First local hour in session
    /// @param close_hour First local hour out of session
    MarketClock(ZonePtr zone, int open_hour, int close_hour);

    /// Build a clock from configuration, failing on an unparseable timezone
    [[nodiscard]] static Result<MarketClock, std::string> from_config(const Config::Market& config);

    /// Parse a POSIX TZ rule (e.g. "EST5EDT,M3.2.0,M11.1.0")
    [[nodiscard]] static Result<ZonePtr, std::string> parse_timezone(const std::string& posix_tz);

    /// True when `now` falls inside the trading session
    [[nodiscard]] bool is_active(WallTime now) const;

    /// Local time of `now` as "YYYY-MM-DD HH:MM TZ", for message text
    [[nodiscard]] std::string format_local(WallTime now) const;

    [[nodiscard]] int open_hour() const noexcept { return open_hour_; }
    [[nodiscard]] int close_hour() const noexcept { return close_hour_; }

private:
    [[nodiscard]] boost::posix_time::ptime to_local(WallTime now) const;

    ZonePtr zone_;
    int open_hour_;
    int close_hour_;
};

}  // namespace moverwatch
