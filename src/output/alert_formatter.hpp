#pragma once

#include "alert/rule_evaluator.hpp"
#include "market/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace moverwatch::output {

/// Renders alerts and notices as plain message text
class AlertFormatter {
public:
    [[nodiscard]] static std::string bid_match(const InstrumentSnapshot& snapshot, BidMatch match);

    [[nodiscard]] static std::string volume_spike(const InstrumentSnapshot& snapshot,
                                                  const VolumeSpike& spike);

    [[nodiscard]] static std::string unusual_insider(const InsiderTrade& trade);

    [[nodiscard]] static std::string large_sale(const InsiderTrade& trade);

    [[nodiscard]] static std::string unusual_options(const DerivativeEvent& event);

    [[nodiscard]] static std::string halt(const InstrumentSnapshot& snapshot);

    /// Ranked list "1. SYM: $price (+x.xx%)"
    /// @param local_time Header timestamp in market time
    [[nodiscard]] static std::string summary(const std::vector<InstrumentSnapshot>& ranked,
                                             const std::string& local_time);

    [[nodiscard]] static std::string service_started(const std::string& local_time);
    [[nodiscard]] static std::string service_stopped(std::uint64_t scans);
    [[nodiscard]] static std::string market_opened(const std::string& local_time);
    [[nodiscard]] static std::string market_closed(const std::string& local_time);
    [[nodiscard]] static std::string heartbeat(std::uint64_t scans, std::size_t watchlist_size);

    /// Task failure report, reason truncated to keep the message short
    [[nodiscard]] static std::string task_failed(const std::string& task, const std::string& reason);

    /// 1234567 -> "1,234,567"
    [[nodiscard]] static std::string group_thousands(Shares value);

    /// 6.0 -> "+6.00%"
    [[nodiscard]] static std::string signed_percent(Percent value);
};

}  // namespace moverwatch::output
