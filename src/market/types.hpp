#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace moverwatch {

/// Point-in-time quote for one instrument, produced fresh on every poll
struct InstrumentSnapshot {
    Symbol symbol;
    std::string name;          // display name, may be empty
    Price price{0.0};          // last price
    Percent change_percent{0.0};  // since previous close, signed
    Shares volume{0};          // traded volume today
    Price bid{0.0};
    Shares bid_size{0};
    Price ask{0.0};
    Shares ask_size{0};
};

/// Direction of an insider transaction
enum class TradeSide {
    Buy,
    Sell,
    Other
};

[[nodiscard]] constexpr std::string_view to_string(TradeSide side) noexcept {
    switch (side) {
        case TradeSide::Buy:   return "BUY";
        case TradeSide::Sell:  return "SELL";
        case TradeSide::Other: return "OTHER";
    }
    return "UNKNOWN";
}

/// One reported insider transaction
struct InsiderTrade {
    Symbol symbol;
    std::string insider;       // filer name, may be empty
    TradeSide side{TradeSide::Other};
    Shares shares{0};
    Price price{0.0};          // 0 when not reported
    double value{0.0};         // total transaction value, 0 when not reported
};

enum class ContractType {
    Call,
    Put,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ContractType type) noexcept {
    switch (type) {
        case ContractType::Call:    return "CALL";
        case ContractType::Put:     return "PUT";
        case ContractType::Unknown: return "OPTION";
    }
    return "OPTION";
}

/// One contract flagged by the unusual options activity feed
struct DerivativeEvent {
    Symbol underlying;
    std::string contract;      // provider contract symbol, may be empty
    ContractType type{ContractType::Unknown};
    Price strike{0.0};
    std::string expiration;    // as reported, e.g. "2024-06-21"
    Shares volume{0};
    Shares open_interest{0};
    double volume_oi_ratio{0.0};  // 0 when open interest is unknown
};

}  // namespace moverwatch
