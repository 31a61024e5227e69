#include "output/alert_formatter.hpp"
#include <cstdint>
#include <spdlog/fmt/fmt.h>

namespace moverwatch::output {

namespace {

constexpr std::size_t kMaxReasonLength = 200;

std::string quote_line(const InstrumentSnapshot& snapshot) {
    return fmt::format("Price ${:.2f} ({})", snapshot.price,
                       AlertFormatter::signed_percent(snapshot.change_percent));
}

std::string title(const std::string& symbol, const std::string& name) {
    return name.empty() ? symbol : fmt::format("{} ({})", symbol, name);
}

std::string insider_line(const InsiderTrade& trade) {
    std::string who = trade.insider.empty() ? "Insider" : trade.insider;
    std::string line = fmt::format("{} {} {} shares", who, to_string(trade.side),
                                   AlertFormatter::group_thousands(trade.shares));
    if (trade.price > 0.0) {
        line += fmt::format(" @ ${:.2f}", trade.price);
    }
    if (trade.value > 0.0) {
        line += fmt::format(" (${})",
                            AlertFormatter::group_thousands(static_cast<Shares>(trade.value)));
    }
    return line;
}

}  // namespace

std::string AlertFormatter::group_thousands(Shares value) {
    // Unsigned magnitude so the most negative value does not overflow
    auto magnitude = value < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(value)
                               : static_cast<std::uint64_t>(value);
    std::string digits = std::to_string(magnitude);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3 + 1);

    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.insert(out.begin(), ',');
        }
        out.insert(out.begin(), *it);
        ++count;
    }
    if (value < 0) {
        out.insert(out.begin(), '-');
    }
    return out;
}

std::string AlertFormatter::signed_percent(Percent value) {
    return fmt::format("{:+.2f}%", value);
}

std::string AlertFormatter::bid_match(const InstrumentSnapshot& snapshot, BidMatch match) {
    const char* label = match == BidMatch::Exact ? "EXACT BID MATCH" : "HIGH VALUE BID";
    return fmt::format("⚡ {}: {}\n${:.2f} with {} shares\n{}",
                       label,
                       title(snapshot.symbol, snapshot.name),
                       snapshot.bid,
                       group_thousands(snapshot.bid_size),
                       quote_line(snapshot));
}

std::string AlertFormatter::volume_spike(const InstrumentSnapshot& snapshot,
                                         const VolumeSpike& spike) {
    return fmt::format("📈 VOLUME SPIKE: {}\nVolume {} vs avg {} ({:.0f}x threshold {})\n{}",
                       title(snapshot.symbol, snapshot.name),
                       group_thousands(spike.volume),
                       group_thousands(static_cast<Shares>(spike.baseline)),
                       spike.multiplier,
                       group_thousands(static_cast<Shares>(spike.threshold)),
                       quote_line(snapshot));
}

std::string AlertFormatter::unusual_insider(const InsiderTrade& trade) {
    return fmt::format("🕵 UNUSUAL INSIDER ACTIVITY: {}\n{}", trade.symbol, insider_line(trade));
}

std::string AlertFormatter::large_sale(const InsiderTrade& trade) {
    return fmt::format("🔻 LARGE INSIDER SALE: {}\n{}", trade.symbol, insider_line(trade));
}

std::string AlertFormatter::unusual_options(const DerivativeEvent& event) {
    std::string contract = std::string(to_string(event.type));
    if (event.strike > 0.0) {
        contract += fmt::format(" {:.2f}", event.strike);
    }
    if (!event.expiration.empty()) {
        contract += " exp " + event.expiration;
    }

    std::string ratio = event.volume_oi_ratio > 0.0
        ? fmt::format(" ({:.1f}x OI)", event.volume_oi_ratio)
        : std::string{};

    return fmt::format("🎯 UNUSUAL OPTIONS: {}\n{}\nVolume {} / OI {}{}",
                       event.underlying,
                       contract,
                       group_thousands(event.volume),
                       group_thousands(event.open_interest),
                       ratio);
}

std::string AlertFormatter::halt(const InstrumentSnapshot& snapshot) {
    return fmt::format("⛔ TRADING HALTED: {}\n{}", title(snapshot.symbol, snapshot.name),
                       quote_line(snapshot));
}

std::string AlertFormatter::summary(const std::vector<InstrumentSnapshot>& ranked,
                                    const std::string& local_time) {
    std::string text = fmt::format("🏆 TOP {} MOVERS ({}):", ranked.size(), local_time);
    int rank = 1;
    for (const auto& snapshot : ranked) {
        text += fmt::format("\n{}. {}: ${:.2f} ({})", rank++, snapshot.symbol, snapshot.price,
                            signed_percent(snapshot.change_percent));
    }
    return text;
}

std::string AlertFormatter::service_started(const std::string& local_time) {
    return fmt::format("🤖 moverwatch started ({})", local_time);
}

std::string AlertFormatter::service_stopped(std::uint64_t scans) {
    return fmt::format("🛑 moverwatch stopped after {} scans", scans);
}

std::string AlertFormatter::market_opened(const std::string& local_time) {
    return fmt::format("🔔 Market open, alerts active ({})", local_time);
}

std::string AlertFormatter::market_closed(const std::string& local_time) {
    return fmt::format("🌙 Market closed ({})", local_time);
}

std::string AlertFormatter::heartbeat(std::uint64_t scans, std::size_t watchlist_size) {
    return fmt::format("💤 Alive, market closed\nScans: {}\nWatchlist: {}", scans, watchlist_size);
}

std::string AlertFormatter::task_failed(const std::string& task, const std::string& reason) {
    std::string shortened = reason.size() > kMaxReasonLength
        ? reason.substr(0, kMaxReasonLength) + "..."
        : reason;
    return fmt::format("💥 Task {} failed: {}", task, shortened);
}

}  // namespace moverwatch::output
