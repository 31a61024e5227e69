#include "engine/alert_engine.hpp"
#include "output/alert_formatter.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace moverwatch {

using output::AlertFormatter;
using output::MessageKind;

AlertEngine::AlertEngine(const Config& config,
                         MarketClock clock,
                         DataSource& source,
                         output::Notifier& notifier)
    : tracking_(config.tracking)
    , evaluator_(config.rules)
    , clock_(std::move(clock))
    , source_(source)
    , notifier_(notifier)
    , baselines_(config.tracking.volume_window, config.tracking.volume_min_samples)
    , ledger_(config.tracking.cooldown)
    , watchlist_(config.tracking.watchlist_ttl)
{}

void AlertEngine::check_market_state(WallTime now) {
    auto transition = session_.update(clock_.is_active(now));

    switch (transition) {
        case SessionTransition::Opened:
            spdlog::info("Market OPEN ({})", clock_.format_local(now));
            break;
        case SessionTransition::Closed:
            spdlog::info("Market CLOSED ({})", clock_.format_local(now));
            notify(AlertFormatter::market_closed(clock_.format_local(now)), MessageKind::Notice);
            break;
        case SessionTransition::None:
            break;
    }

    if (session_.startup_notice_pending()) {
        notify(AlertFormatter::market_opened(clock_.format_local(now)), MessageKind::Notice);
        session_.mark_startup_notice_sent();
    }
}

std::vector<Alert> AlertEngine::scan_top_movers(WallTime now) {
    ++scan_count_;

    auto movers = source_.fetch_top_movers(tracking_.top_movers_limit);
    spdlog::info("Scan #{}: {} instruments", scan_count_, movers.size());

    std::vector<Alert> fired;
    for (const auto& snapshot : movers) {
        evaluate_instrument(snapshot, now, fired);
    }

    if (!fired.empty()) {
        spdlog::info("Scan #{}: {} alert(s) fired", scan_count_, fired.size());
    }
    return fired;
}

void AlertEngine::evaluate_instrument(const InstrumentSnapshot& snapshot, WallTime now,
                                      std::vector<Alert>& fired) {
    const auto& symbol = snapshot.symbol;

    // Compare against the baseline before this sample joins it
    auto evaluation = evaluator_.evaluate(snapshot, baselines_.average(symbol));

    // A missing volume is not a sample
    if (snapshot.volume > 0) {
        (void)baselines_.observe(symbol, snapshot.volume);
    }

    if (evaluation.volume_spike && ledger_.allow(symbol, AlertKind::VolumeSpike, now)) {
        fired.push_back(dispatch(AlertKind::VolumeSpike, symbol,
                                 AlertFormatter::volume_spike(snapshot, *evaluation.volume_spike),
                                 now));
    }

    if (evaluation.bid_match != BidMatch::None) {
        auto kind = evaluation.bid_match == BidMatch::Exact
            ? AlertKind::BidMatchExact
            : AlertKind::BidMatchHighValue;

        if (!ledger_.allow(symbol, kind, now)) {
            spdlog::debug("{} {} suppressed by cooldown", symbol, to_string(kind));
            return;
        }

        if (watchlist_.add(symbol, now)) {
            spdlog::info("{} added to watchlist ({} symbols)", symbol, watchlist_.size());
        }
        fired.push_back(dispatch(kind, symbol,
                                 AlertFormatter::bid_match(snapshot, evaluation.bid_match), now));
        check_halt(snapshot, now, fired);
        return;
    }

    if (evaluation.wants_insider_check()) {
        auto trades = source_.fetch_insider_trades(symbol);
        auto trade = evaluator_.find_unusual_insider(symbol, trades);
        if (trade && ledger_.allow(symbol, AlertKind::UnusualInsiderActivity, now)) {
            auto shown = *trade;
            shown.symbol = symbol;
            fired.push_back(dispatch(AlertKind::UnusualInsiderActivity, symbol,
                                     AlertFormatter::unusual_insider(shown), now));
        }
    }
}

void AlertEngine::check_halt(const InstrumentSnapshot& snapshot, WallTime now,
                             std::vector<Alert>& fired) {
    if (!source_.fetch_halt_status(snapshot.symbol)) {
        return;
    }
    if (ledger_.allow(snapshot.symbol, AlertKind::Halt, now)) {
        fired.push_back(dispatch(AlertKind::Halt, snapshot.symbol,
                                 AlertFormatter::halt(snapshot), now));
    }
}

std::vector<Alert> AlertEngine::scan_unusual_options(WallTime now) {
    auto events = source_.fetch_unusual_derivative_activity();
    spdlog::debug("Options scan: {} contracts", events.size());

    std::vector<Alert> fired;
    for (const auto& event : events) {
        if (!evaluator_.is_unusual_derivative(event)) {
            continue;
        }
        // Keyed by underlying: one alert per underlying per cooldown
        if (ledger_.allow(event.underlying, AlertKind::UnusualOptionsActivity, now)) {
            fired.push_back(dispatch(AlertKind::UnusualOptionsActivity, event.underlying,
                                     AlertFormatter::unusual_options(event), now));
        }
    }
    return fired;
}

std::vector<Alert> AlertEngine::sweep_watchlist(WallTime now) {
    std::vector<Alert> fired;

    for (const auto& symbol : watchlist_.snapshot()) {
        auto trades = source_.fetch_insider_trades(symbol);
        auto sale = evaluator_.find_large_sale(symbol, trades);
        if (sale && ledger_.allow(symbol, AlertKind::LargeSale, now)) {
            auto shown = *sale;
            shown.symbol = symbol;
            fired.push_back(dispatch(AlertKind::LargeSale, symbol,
                                     AlertFormatter::large_sale(shown), now));
        }
    }
    return fired;
}

Symbol AlertEngine::summary_bucket_key(WallTime now) {
    auto minute = std::chrono::duration_cast<std::chrono::minutes>(now.time_since_epoch()).count();
    return "summary@" + std::to_string(minute);
}

std::optional<Alert> AlertEngine::send_summary(WallTime now) {
    auto key = summary_bucket_key(now);
    if (ledger_.last_fired(key, AlertKind::PeriodicSummary)) {
        spdlog::debug("Summary already sent for {}", key);
        return std::nullopt;
    }

    auto movers = source_.fetch_top_movers(tracking_.top_movers_limit);
    if (movers.empty()) {
        spdlog::info("Summary skipped: no movers");
        return std::nullopt;
    }

    std::stable_sort(movers.begin(), movers.end(), [](const auto& a, const auto& b) {
        return a.change_percent > b.change_percent;
    });
    if (movers.size() > tracking_.summary_size) {
        movers.resize(tracking_.summary_size);
    }

    if (!ledger_.allow(key, AlertKind::PeriodicSummary, now)) {
        return std::nullopt;
    }

    Alert alert{
        .kind = AlertKind::PeriodicSummary,
        .symbol = key,
        .message = AlertFormatter::summary(movers, clock_.format_local(now)),
        .fired_at = now
    };
    alert.delivered = notifier_.send(alert.message, MessageKind::Summary);
    spdlog::info("Summary of {} movers {}", movers.size(),
                 alert.delivered ? "sent" : "not delivered");
    return alert;
}

void AlertEngine::housekeeping(WallTime now) {
    auto pruned = ledger_.prune(now);
    auto expired = watchlist_.expire(now);

    spdlog::info("Housekeeping: pruned {} cooldown(s), expired {} watchlist symbol(s); "
                 "tracking {} baselines, {} cooldowns, {} watched",
                 pruned, expired, baselines_.symbol_count(), ledger_.size(), watchlist_.size());
}

void AlertEngine::send_heartbeat(WallTime /*now*/) {
    notify(AlertFormatter::heartbeat(scan_count_, watchlist_.size()), MessageKind::Notice);
}

void AlertEngine::announce_startup(WallTime now) {
    notify(AlertFormatter::service_started(clock_.format_local(now)), MessageKind::Notice);
}

void AlertEngine::announce_shutdown() {
    notify(AlertFormatter::service_stopped(scan_count_), MessageKind::Notice);
}

void AlertEngine::report_task_failure(const std::string& task, const std::string& reason) {
    notify(AlertFormatter::task_failed(task, reason), MessageKind::Error);
}

Alert AlertEngine::dispatch(AlertKind kind, const Symbol& symbol, std::string message, WallTime now) {
    spdlog::warn("ALERT {} {}", to_string(kind), symbol);

    Alert alert{
        .kind = kind,
        .symbol = symbol,
        .message = std::move(message),
        .fired_at = now
    };
    alert.delivered = notifier_.send(alert.message, MessageKind::Alert);
    if (!alert.delivered) {
        spdlog::warn("ALERT {} {} not delivered", to_string(kind), symbol);
    }
    return alert;
}

void AlertEngine::notify(const std::string& text, output::MessageKind kind) {
    if (!notifier_.send(text, kind)) {
        spdlog::warn("{} message not delivered", to_string(kind));
    }
}

}  // namespace moverwatch
