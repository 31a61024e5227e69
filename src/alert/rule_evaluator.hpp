#pragma once

#include "core/config.hpp"
#include "market/types.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace moverwatch {

/// Outcome of the bid-match rules. Exact takes priority over high-value.
enum class BidMatch {
    None,
    Exact,
    HighValue
};

[[nodiscard]] constexpr std::string_view to_string(BidMatch match) noexcept {
    switch (match) {
        case BidMatch::None:      return "NONE";
        case BidMatch::Exact:     return "EXACT";
        case BidMatch::HighValue: return "HIGH_VALUE";
    }
    return "UNKNOWN";
}

/// Volume spike details
struct VolumeSpike {
    Shares volume;
    double baseline;     // rolling average the volume was compared to
    double multiplier;   // step-table multiplier for the move size
    double threshold;    // baseline * multiplier

    friend bool operator==(const VolumeSpike&, const VolumeSpike&) = default;
};

/// Primary-rule results for one instrument in one scan
struct PrimaryEvaluation {
    std::optional<VolumeSpike> volume_spike;
    bool passes_move_gate{false};
    BidMatch bid_match{BidMatch::None};

    /// The insider rule runs only past the move gate and without a bid match
    [[nodiscard]] bool wants_insider_check() const noexcept {
        return passes_move_gate && bid_match == BidMatch::None;
    }

    friend bool operator==(const PrimaryEvaluation&, const PrimaryEvaluation&) = default;
};

/// Stateless threshold rules. Everything it needs arrives as arguments;
/// baselines and cooldowns are owned elsewhere.
class RuleEvaluator {
public:
    /// Create an evaluator
    /// @param rules Threshold configuration
    explicit RuleEvaluator(const Config::Rules& rules);

    /// Step-table multiplier for an absolute percent move:
    /// [1,10)->10, [10,50)->20, [50,100)->30, [100,200)->50, [200,inf)->100,
    /// below 1 -> 10
    [[nodiscard]] static double spike_multiplier(Percent abs_change) noexcept;

    /// Check the volume spike rule
    /// @param snapshot Current quote
    /// @param baseline Rolling average before this sample, nullopt if undefined
    /// @return Spike details if volume exceeds baseline * multiplier
    [[nodiscard]] std::optional<VolumeSpike> check_volume_spike(
        const InstrumentSnapshot& snapshot,
        std::optional<double> baseline
    ) const;

    /// True when |change%| reaches the minimum move
    [[nodiscard]] bool passes_move_gate(const InstrumentSnapshot& snapshot) const noexcept;

    /// Check the bid-match rules (exact first, then high-value)
    [[nodiscard]] BidMatch check_bid_match(const InstrumentSnapshot& snapshot) const noexcept;

    /// Evaluate all primary rules for one instrument in priority order
    [[nodiscard]] PrimaryEvaluation evaluate(
        const InstrumentSnapshot& snapshot,
        std::optional<double> baseline
    ) const;

    /// First trade for symbol at or above the insider share floor, any side
    [[nodiscard]] std::optional<InsiderTrade> find_unusual_insider(
        const Symbol& symbol,
        const std::vector<InsiderTrade>& trades
    ) const;

    /// First SELL trade for symbol at or above the insider share floor
    [[nodiscard]] std::optional<InsiderTrade> find_large_sale(
        const Symbol& symbol,
        const std::vector<InsiderTrade>& trades
    ) const;

    /// True when volume/OI or absolute volume exceeds its floor
    [[nodiscard]] bool is_unusual_derivative(const DerivativeEvent& event) const noexcept;

    [[nodiscard]] const Config::Rules& rules() const noexcept { return rules_; }

private:
    Config::Rules rules_;
};

}  // namespace moverwatch
