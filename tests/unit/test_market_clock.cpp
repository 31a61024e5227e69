#include <gtest/gtest.h>
#include "market/market_clock.hpp"
#include "market/market_session.hpp"
#include <chrono>

using namespace moverwatch;
using namespace std::chrono;

namespace {

/// UTC instant from calendar fields
WallTime utc(int y, unsigned m, unsigned d, int hour, int minute = 0) {
    return sys_days{year{y} / month{m} / day{d}} + hours{hour} + minutes{minute};
}

MarketClock eastern_clock(int open_hour = 6, int close_hour = 18) {
    auto zone = MarketClock::parse_timezone("EST5EDT,M3.2.0,M11.1.0");
    return MarketClock(zone.value(), open_hour, close_hour);
}

}  // namespace

// ============================================================================
// MarketClock Tests
// ============================================================================

// 2024-03-13 is a Wednesday, EDT (UTC-4)

TEST(MarketClockTest, ActiveInsideSession) {
    auto clock = eastern_clock();

    EXPECT_TRUE(clock.is_active(utc(2024, 3, 13, 10)));       // 06:00 local
    EXPECT_TRUE(clock.is_active(utc(2024, 3, 13, 16, 30)));   // 12:30 local
    EXPECT_TRUE(clock.is_active(utc(2024, 3, 13, 21, 59)));   // 17:59 local
}

TEST(MarketClockTest, HourBoundaries) {
    auto clock = eastern_clock();

    EXPECT_FALSE(clock.is_active(utc(2024, 3, 13, 9)));       // 05:00 local
    EXPECT_FALSE(clock.is_active(utc(2024, 3, 13, 9, 59)));   // 05:59 local
    EXPECT_FALSE(clock.is_active(utc(2024, 3, 13, 22)));      // 18:00 local
}

TEST(MarketClockTest, WeekendsAlwaysInactive) {
    auto clock = eastern_clock(0, 24);

    for (int hour = 0; hour < 24; ++hour) {
        // Saturday 2024-03-16 and Sunday 2024-03-17, local hours
        EXPECT_FALSE(clock.is_active(utc(2024, 3, 16, hour) + hours{4})) << "Saturday " << hour;
        EXPECT_FALSE(clock.is_active(utc(2024, 3, 17, hour) + hours{4})) << "Sunday " << hour;
    }
}

TEST(MarketClockTest, WeekdayIsLocalNotUtc) {
    auto clock = eastern_clock(0, 24);

    // Monday 00:30 UTC is still Sunday evening in New York
    EXPECT_FALSE(clock.is_active(utc(2024, 3, 18, 0, 30)));
    // Saturday 01:00 UTC is still Friday evening in New York
    EXPECT_TRUE(clock.is_active(utc(2024, 3, 16, 1)));
}

TEST(MarketClockTest, FollowsDaylightSaving) {
    auto clock = eastern_clock();

    // 10:30 UTC: 06:30 EDT in summer, 05:30 EST in winter
    EXPECT_TRUE(clock.is_active(utc(2024, 7, 10, 10, 30)));
    EXPECT_FALSE(clock.is_active(utc(2024, 1, 10, 10, 30)));
    EXPECT_TRUE(clock.is_active(utc(2024, 1, 10, 11, 30)));
}

TEST(MarketClockTest, FormatLocal) {
    auto clock = eastern_clock();

    EXPECT_EQ(clock.format_local(utc(2024, 3, 13, 14, 30)), "2024-03-13 10:30 EDT");
    EXPECT_EQ(clock.format_local(utc(2024, 1, 10, 14, 5)), "2024-01-10 09:05 EST");
}

TEST(MarketClockTest, FromConfig) {
    Config::Market market;
    market.open_hour = 9;
    market.close_hour = 16;

    auto clock = MarketClock::from_config(market);

    ASSERT_TRUE(clock.is_ok());
    EXPECT_EQ(clock.value().open_hour(), 9);
    EXPECT_EQ(clock.value().close_hour(), 16);
    EXPECT_FALSE(clock.value().is_active(utc(2024, 3, 13, 12)));  // 08:00 local
    EXPECT_TRUE(clock.value().is_active(utc(2024, 3, 13, 13)));   // 09:00 local
}

TEST(MarketClockTest, InvalidTimezoneIsAnError) {
    auto zone = MarketClock::parse_timezone("EST5EDT,M13.2.0,M11.1.0");

    ASSERT_TRUE(zone.is_err());
    EXPECT_TRUE(zone.error().find("Invalid timezone") != std::string::npos);
}

// ============================================================================
// MarketSession Tests
// ============================================================================

TEST(MarketSessionTest, StartsClosed) {
    MarketSession session;

    EXPECT_EQ(session.state(), MarketState::Closed);
    EXPECT_FALSE(session.is_open());
    EXPECT_FALSE(session.startup_notice_pending());
}

TEST(MarketSessionTest, ReportsEdgesOnly) {
    MarketSession session;

    EXPECT_EQ(session.update(false), SessionTransition::None);
    EXPECT_EQ(session.update(true), SessionTransition::Opened);
    EXPECT_EQ(session.update(true), SessionTransition::None);
    EXPECT_EQ(session.update(false), SessionTransition::Closed);
    EXPECT_EQ(session.update(false), SessionTransition::None);
}

TEST(MarketSessionTest, StartupNoticeOncePerSession) {
    MarketSession session;

    session.update(true);
    EXPECT_TRUE(session.startup_notice_pending());

    session.mark_startup_notice_sent();
    session.update(true);
    EXPECT_FALSE(session.startup_notice_pending());

    // Closing re-arms the notice for the next opening
    session.update(false);
    EXPECT_FALSE(session.startup_notice_pending());
    session.update(true);
    EXPECT_TRUE(session.startup_notice_pending());
}
