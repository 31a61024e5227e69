#pragma once

#include <array>
#include <string_view>

namespace moverwatch {

/// Every kind of alert the engine can raise. Cooldowns are tracked per
/// (symbol, kind), so two kinds never suppress each other.
enum class AlertKind {
    BidMatchExact,
    BidMatchHighValue,
    VolumeSpike,
    UnusualInsiderActivity,
    UnusualOptionsActivity,
    Halt,
    LargeSale,
    PeriodicSummary
};

inline constexpr std::array<AlertKind, 8> kAllAlertKinds = {
    AlertKind::BidMatchExact,
    AlertKind::BidMatchHighValue,
    AlertKind::VolumeSpike,
    AlertKind::UnusualInsiderActivity,
    AlertKind::UnusualOptionsActivity,
    AlertKind::Halt,
    AlertKind::LargeSale,
    AlertKind::PeriodicSummary
};

/// Convert AlertKind to its stable identifier for logging
[[nodiscard]] constexpr std::string_view to_string(AlertKind kind) noexcept {
    switch (kind) {
        case AlertKind::BidMatchExact:          return "bid-match-exact";
        case AlertKind::BidMatchHighValue:      return "bid-match-high-value";
        case AlertKind::VolumeSpike:            return "volume-spike";
        case AlertKind::UnusualInsiderActivity: return "unusual-insider-activity";
        case AlertKind::UnusualOptionsActivity: return "unusual-options-activity";
        case AlertKind::Halt:                   return "halt";
        case AlertKind::LargeSale:              return "large-sale";
        case AlertKind::PeriodicSummary:        return "periodic-summary";
    }
    return "unknown";
}

}  // namespace moverwatch
