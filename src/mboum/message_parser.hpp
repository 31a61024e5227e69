#pragma once

#include "core/status.hpp"
#include "market/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace moverwatch::mboum {

/// Parser for Mboum REST responses.
///
/// Whole-payload problems (invalid JSON, no record array) are errors.
/// A single malformed record is logged and skipped; the rest of the batch
/// is still returned.
class MessageParser {
public:
    /// Parse a screener response into instrument snapshots
    [[nodiscard]] static Result<std::vector<InstrumentSnapshot>, std::string>
    parse_screener(std::string_view json);

    /// Parse an insider trades response
    [[nodiscard]] static Result<std::vector<InsiderTrade>, std::string>
    parse_insider_trades(std::string_view json);

    /// Parse an unusual options activity response
    [[nodiscard]] static Result<std::vector<DerivativeEvent>, std::string>
    parse_unusual_options(std::string_view json);

    /// Parse a quote response and report whether trading is halted.
    /// A quote without any halt indicator counts as not halted.
    [[nodiscard]] static Result<bool, std::string>
    parse_halt_status(std::string_view json);

    /// Map a provider transaction label ("Sale", "S - Sale", "Purchase") to a side
    [[nodiscard]] static TradeSide parse_trade_side(std::string_view label);
};

}  // namespace moverwatch::mboum
