#include "alert/rule_evaluator.hpp"
#include <cmath>

namespace moverwatch {

namespace {

/// Trades without a symbol are assumed to belong to the queried one
bool belongs_to(const InsiderTrade& trade, const Symbol& symbol) {
    return trade.symbol.empty() || trade.symbol == symbol;
}

}  // namespace

RuleEvaluator::RuleEvaluator(const Config::Rules& rules)
    : rules_(rules)
{}

double RuleEvaluator::spike_multiplier(Percent abs_change) noexcept {
    if (abs_change >= 200.0) return 100.0;
    if (abs_change >= 100.0) return 50.0;
    if (abs_change >= 50.0) return 30.0;
    if (abs_change >= 10.0) return 20.0;
    return 10.0;
}

std::optional<VolumeSpike> RuleEvaluator::check_volume_spike(
    const InstrumentSnapshot& snapshot,
    std::optional<double> baseline
) const {
    // Undefined or empty baseline can never spike
    if (!baseline || *baseline <= 0.0) {
        return std::nullopt;
    }

    double multiplier = spike_multiplier(std::fabs(snapshot.change_percent));
    double threshold = *baseline * multiplier;

    if (static_cast<double>(snapshot.volume) > threshold) {
        return VolumeSpike{
            .volume = snapshot.volume,
            .baseline = *baseline,
            .multiplier = multiplier,
            .threshold = threshold
        };
    }

    return std::nullopt;
}

bool RuleEvaluator::passes_move_gate(const InstrumentSnapshot& snapshot) const noexcept {
    return std::fabs(snapshot.change_percent) >= rules_.min_percent_move;
}

BidMatch RuleEvaluator::check_bid_match(const InstrumentSnapshot& snapshot) const noexcept {
    if (snapshot.bid == rules_.exact_bid_price && snapshot.bid_size == rules_.exact_bid_size) {
        return BidMatch::Exact;
    }
    if (snapshot.bid >= rules_.high_value_bid_price &&
        snapshot.bid_size >= rules_.high_value_bid_size) {
        return BidMatch::HighValue;
    }
    return BidMatch::None;
}

PrimaryEvaluation RuleEvaluator::evaluate(
    const InstrumentSnapshot& snapshot,
    std::optional<double> baseline
) const {
    PrimaryEvaluation result;

    // Spike is independent of the move gate
    result.volume_spike = check_volume_spike(snapshot, baseline);

    result.passes_move_gate = passes_move_gate(snapshot);
    if (!result.passes_move_gate) {
        return result;
    }

    result.bid_match = check_bid_match(snapshot);
    return result;
}

std::optional<InsiderTrade> RuleEvaluator::find_unusual_insider(
    const Symbol& symbol,
    const std::vector<InsiderTrade>& trades
) const {
    for (const auto& trade : trades) {
        if (belongs_to(trade, symbol) && trade.shares >= rules_.insider_share_floor) {
            return trade;
        }
    }
    return std::nullopt;
}

std::optional<InsiderTrade> RuleEvaluator::find_large_sale(
    const Symbol& symbol,
    const std::vector<InsiderTrade>& trades
) const {
    for (const auto& trade : trades) {
        if (belongs_to(trade, symbol) && trade.side == TradeSide::Sell &&
            trade.shares >= rules_.insider_share_floor) {
            return trade;
        }
    }
    return std::nullopt;
}

bool RuleEvaluator::is_unusual_derivative(const DerivativeEvent& event) const noexcept {
    return event.volume_oi_ratio > rules_.options_volume_oi_ratio ||
           event.volume > rules_.options_volume_floor;
}

}  // namespace moverwatch
