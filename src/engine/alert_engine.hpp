#pragma once

#include "alert/alert.hpp"
#include "alert/alert_ledger.hpp"
#include "alert/rule_evaluator.hpp"
#include "alert/volume_baseline.hpp"
#include "alert/watchlist.hpp"
#include "core/config.hpp"
#include "market/data_source.hpp"
#include "market/market_clock.hpp"
#include "market/market_session.hpp"
#include "output/notifier.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace moverwatch {

/// Owns all alerting state (baselines, cooldowns, watchlist, session) and
/// implements the body of every scheduled task. One instance per process;
/// collaborators are borrowed and must outlive it.
class AlertEngine {
public:
    /// Create an alert engine
    /// @param config Application configuration
    /// @param clock Market hours for the reference timezone
    /// @param source Quote and secondary data provider
    /// @param notifier Messaging sink
    AlertEngine(const Config& config,
                MarketClock clock,
                DataSource& source,
                output::Notifier& notifier);

    // Non-copyable, non-movable
    AlertEngine(const AlertEngine&) = delete;
    AlertEngine& operator=(const AlertEngine&) = delete;

    /// Re-read the market clock; announces opening and closing edges
    void check_market_state(WallTime now);

    /// Primary scan: top movers through spike, bid-match and insider rules
    /// @return Alerts that passed their cooldown this scan
    std::vector<Alert> scan_top_movers(WallTime now);

    /// Unusual options activity, one alert per underlying per cooldown
    std::vector<Alert> scan_unusual_options(WallTime now);

    /// Large insider sales for every watchlist symbol
    std::vector<Alert> sweep_watchlist(WallTime now);

    /// Ranked top movers list, at most once per minute bucket
    std::optional<Alert> send_summary(WallTime now);

    /// Evict elapsed cooldowns and expired watchlist entries
    void housekeeping(WallTime now);

    /// Closed-market liveness message
    void send_heartbeat(WallTime now);

    void announce_startup(WallTime now);
    void announce_shutdown();

    /// Best-effort report of a failed task
    void report_task_failure(const std::string& task, const std::string& reason);

    [[nodiscard]] bool market_open() const noexcept { return session_.is_open(); }
    [[nodiscard]] std::uint64_t scan_count() const noexcept { return scan_count_; }

    [[nodiscard]] const AlertLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const Watchlist& watchlist() const noexcept { return watchlist_; }
    [[nodiscard]] const VolumeBaselineTracker& baselines() const noexcept { return baselines_; }
    [[nodiscard]] const MarketSession& session() const noexcept { return session_; }

    /// Ledger key for the summary of the minute containing `now`
    [[nodiscard]] static Symbol summary_bucket_key(WallTime now);

private:
    void evaluate_instrument(const InstrumentSnapshot& snapshot, WallTime now,
                             std::vector<Alert>& fired);
    void check_halt(const InstrumentSnapshot& snapshot, WallTime now,
                    std::vector<Alert>& fired);
    Alert dispatch(AlertKind kind, const Symbol& symbol, std::string message, WallTime now);
    void notify(const std::string& text, output::MessageKind kind);

    Config::Tracking tracking_;
    RuleEvaluator evaluator_;
    MarketClock clock_;

    DataSource& source_;
    output::Notifier& notifier_;

    VolumeBaselineTracker baselines_;
    AlertLedger ledger_;
    Watchlist watchlist_;
    MarketSession session_;

    std::uint64_t scan_count_{0};
};

}  // namespace moverwatch
