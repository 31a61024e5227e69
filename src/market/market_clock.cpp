#include "market/market_clock.hpp"
#include <spdlog/fmt/fmt.h>

namespace moverwatch {

MarketClock::MarketClock(ZonePtr zone, int open_hour, int close_hour)
    : zone_(std::move(zone))
    , open_hour_(open_hour)
    , close_hour_(close_hour)
{}

Result<MarketClock, std::string> MarketClock::from_config(const Config::Market& config) {
    auto zone = parse_timezone(config.timezone);
    if (zone.is_err()) {
        return Result<MarketClock, std::string>::Err(zone.error());
    }
    return Result<MarketClock, std::string>::Ok(
        MarketClock(zone.value(), config.open_hour, config.close_hour)
    );
}

Result<MarketClock::ZonePtr, std::string> MarketClock::parse_timezone(const std::string& posix_tz) {
    try {
        ZonePtr zone(new boost::local_time::posix_time_zone(posix_tz));
        return Result<ZonePtr, std::string>::Ok(std::move(zone));
    } catch (const std::exception& e) {
        return Result<ZonePtr, std::string>::Err(
            "Invalid timezone '" + posix_tz + "': " + e.what()
        );
    }
}

boost::posix_time::ptime MarketClock::to_local(WallTime now) const {
    auto utc = boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(now));
    boost::local_time::local_date_time local(utc, zone_);
    return local.local_time();
}

bool MarketClock::is_active(WallTime now) const {
    auto local = to_local(now);

    auto weekday = local.date().day_of_week().as_number();  // 0 = Sunday
    if (weekday == 0 || weekday == 6) {
        return false;
    }

    auto hour = static_cast<int>(local.time_of_day().hours());
    return hour >= open_hour_ && hour < close_hour_;
}

std::string MarketClock::format_local(WallTime now) const {
    auto utc = boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(now));
    boost::local_time::local_date_time ldt(utc, zone_);
    auto local = ldt.local_time();

    const auto date = local.date();
    const auto tod = local.time_of_day();
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d} {}",
                       static_cast<int>(date.year()),
                       static_cast<int>(date.month().as_number()),
                       static_cast<int>(date.day()),
                       static_cast<int>(tod.hours()),
                       static_cast<int>(tod.minutes()),
                       ldt.zone_abbrev());
}

}  // namespace moverwatch
