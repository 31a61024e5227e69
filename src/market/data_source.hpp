#pragma once

#include "market/types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace moverwatch {

/// Provider of quotes and secondary datasets.
///
/// Implementations never throw for transport or payload problems: a
/// failed fetch is reported as an empty result (or false for halt
/// status), which callers treat as "nothing this cycle".
class DataSource {
public:
    virtual ~DataSource() = default;

    /// Today's top movers, at most `limit` instruments
    [[nodiscard]] virtual std::vector<InstrumentSnapshot> fetch_top_movers(std::size_t limit) = 0;

    /// Recent insider trades, for one symbol or market-wide
    [[nodiscard]] virtual std::vector<InsiderTrade> fetch_insider_trades(
        const std::optional<Symbol>& symbol) = 0;

    /// Contracts flagged by the provider's unusual options activity feed
    [[nodiscard]] virtual std::vector<DerivativeEvent> fetch_unusual_derivative_activity() = 0;

    /// True when trading in symbol is currently halted
    [[nodiscard]] virtual bool fetch_halt_status(const Symbol& symbol) = 0;
};

}  // namespace moverwatch
