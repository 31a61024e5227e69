#include <gtest/gtest.h>
#include "alert/rule_evaluator.hpp"

using namespace moverwatch;

namespace {

InstrumentSnapshot make_snapshot(const Symbol& symbol, Percent change, Shares volume,
                                 Price bid = 0.0, Shares bid_size = 0) {
    InstrumentSnapshot s;
    s.symbol = symbol;
    s.price = 10.0;
    s.change_percent = change;
    s.volume = volume;
    s.bid = bid;
    s.bid_size = bid_size;
    return s;
}

InsiderTrade make_trade(const Symbol& symbol, TradeSide side, Shares shares) {
    InsiderTrade t;
    t.symbol = symbol;
    t.insider = "Jane Doe";
    t.side = side;
    t.shares = shares;
    return t;
}

}  // namespace

class RuleEvaluatorTest : public ::testing::Test {
protected:
    RuleEvaluator evaluator{Config::defaults().rules};
};

// ============================================================================
// Spike multiplier table
// ============================================================================

TEST_F(RuleEvaluatorTest, MultiplierBucketBoundaries) {
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(0.0), 10.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(1.0), 10.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(9.99), 10.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(10.0), 20.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(49.99), 20.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(50.0), 30.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(99.99), 30.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(100.0), 50.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(199.99), 50.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(200.0), 100.0);
    EXPECT_DOUBLE_EQ(RuleEvaluator::spike_multiplier(5000.0), 100.0);
}

// ============================================================================
// Volume spike
// ============================================================================

TEST_F(RuleEvaluatorTest, SpikeFiresAboveThreshold) {
    // 10 samples averaging 10,000; +15% -> multiplier 20 -> threshold 200,000
    auto spike = evaluator.check_volume_spike(make_snapshot("ABC", 15.0, 250000), 10000.0);

    ASSERT_TRUE(spike.has_value());
    EXPECT_EQ(spike->volume, 250000);
    EXPECT_DOUBLE_EQ(spike->baseline, 10000.0);
    EXPECT_DOUBLE_EQ(spike->multiplier, 20.0);
    EXPECT_DOUBLE_EQ(spike->threshold, 200000.0);
}

TEST_F(RuleEvaluatorTest, SpikeRequiresStrictlyGreater) {
    EXPECT_FALSE(evaluator.check_volume_spike(make_snapshot("ABC", 15.0, 200000), 10000.0));
    EXPECT_TRUE(evaluator.check_volume_spike(make_snapshot("ABC", 15.0, 200001), 10000.0));
}

TEST_F(RuleEvaluatorTest, SpikeUsesAbsoluteMove) {
    auto spike = evaluator.check_volume_spike(make_snapshot("DN", -60.0, 400000), 10000.0);

    ASSERT_TRUE(spike.has_value());
    EXPECT_DOUBLE_EQ(spike->multiplier, 30.0);
}

TEST_F(RuleEvaluatorTest, NoSpikeWithoutBaseline) {
    EXPECT_FALSE(evaluator.check_volume_spike(make_snapshot("ABC", 15.0, 10000000), std::nullopt));
    EXPECT_FALSE(evaluator.check_volume_spike(make_snapshot("ABC", 15.0, 10000000), 0.0));
}

// ============================================================================
// Move gate and bid matches
// ============================================================================

TEST_F(RuleEvaluatorTest, MoveGateIsInclusiveAndSymmetric) {
    EXPECT_TRUE(evaluator.passes_move_gate(make_snapshot("A", 5.0, 0)));
    EXPECT_TRUE(evaluator.passes_move_gate(make_snapshot("A", -5.0, 0)));
    EXPECT_FALSE(evaluator.passes_move_gate(make_snapshot("A", 4.99, 0)));
    EXPECT_FALSE(evaluator.passes_move_gate(make_snapshot("A", -4.99, 0)));
}

TEST_F(RuleEvaluatorTest, ExactBidMatch) {
    auto snapshot = make_snapshot("XYZ", 6.0, 0, 199999.0, 100);

    EXPECT_EQ(evaluator.check_bid_match(snapshot), BidMatch::Exact);
}

TEST_F(RuleEvaluatorTest, ExactBidTakesPriorityOverHighValue) {
    // 199999 >= 2000 and 100 >= 20 would also be high-value
    auto evaluation = evaluator.evaluate(make_snapshot("XYZ", 6.0, 0, 199999.0, 100), std::nullopt);

    EXPECT_EQ(evaluation.bid_match, BidMatch::Exact);
    EXPECT_FALSE(evaluation.wants_insider_check());
}

TEST_F(RuleEvaluatorTest, HighValueBidMatch) {
    EXPECT_EQ(evaluator.check_bid_match(make_snapshot("HV", 6.0, 0, 2000.0, 20)), BidMatch::HighValue);
    EXPECT_EQ(evaluator.check_bid_match(make_snapshot("HV", 6.0, 0, 199999.0, 99)), BidMatch::HighValue);
    EXPECT_EQ(evaluator.check_bid_match(make_snapshot("HV", 6.0, 0, 1999.99, 20)), BidMatch::None);
    EXPECT_EQ(evaluator.check_bid_match(make_snapshot("HV", 6.0, 0, 2000.0, 19)), BidMatch::None);
}

TEST_F(RuleEvaluatorTest, BidMatchNeedsMoveGate) {
    auto evaluation = evaluator.evaluate(make_snapshot("XYZ", 2.0, 0, 199999.0, 100), std::nullopt);

    EXPECT_FALSE(evaluation.passes_move_gate);
    EXPECT_EQ(evaluation.bid_match, BidMatch::None);
    EXPECT_FALSE(evaluation.wants_insider_check());
}

TEST_F(RuleEvaluatorTest, SpikeIndependentOfMoveGate) {
    // +2% -> multiplier 10, threshold 100,000
    auto evaluation = evaluator.evaluate(make_snapshot("LOW", 2.0, 150000), 10000.0);

    EXPECT_TRUE(evaluation.volume_spike.has_value());
    EXPECT_FALSE(evaluation.passes_move_gate);
}

TEST_F(RuleEvaluatorTest, InsiderCheckWantedWithoutBidMatch) {
    auto evaluation = evaluator.evaluate(make_snapshot("MOVE", 12.0, 1000, 10.0, 5), std::nullopt);

    EXPECT_TRUE(evaluation.passes_move_gate);
    EXPECT_EQ(evaluation.bid_match, BidMatch::None);
    EXPECT_TRUE(evaluation.wants_insider_check());
}

TEST_F(RuleEvaluatorTest, ReplayIsIdempotent) {
    std::vector<InstrumentSnapshot> batch = {
        make_snapshot("ABC", 15.0, 250000),
        make_snapshot("XYZ", 6.0, 0, 199999.0, 100),
        make_snapshot("HV", -8.0, 5000, 2500.0, 40),
        make_snapshot("FLAT", 0.5, 100)
    };

    std::vector<PrimaryEvaluation> first;
    for (const auto& s : batch) {
        first.push_back(evaluator.evaluate(s, 10000.0));
    }

    for (int round = 0; round < 3; ++round) {
        for (std::size_t i = 0; i < batch.size(); ++i) {
            EXPECT_EQ(evaluator.evaluate(batch[i], 10000.0), first[i]);
        }
    }
}

// ============================================================================
// Insider and options rules
// ============================================================================

TEST_F(RuleEvaluatorTest, UnusualInsiderAnySide) {
    std::vector<InsiderTrade> trades = {
        make_trade("MOVE", TradeSide::Buy, 500),
        make_trade("MOVE", TradeSide::Buy, 10000),
    };

    auto trade = evaluator.find_unusual_insider("MOVE", trades);

    ASSERT_TRUE(trade.has_value());
    EXPECT_EQ(trade->shares, 10000);
    EXPECT_EQ(trade->side, TradeSide::Buy);
}

TEST_F(RuleEvaluatorTest, UnusualInsiderIgnoresOtherSymbols) {
    std::vector<InsiderTrade> trades = {make_trade("OTHER", TradeSide::Sell, 90000)};

    EXPECT_FALSE(evaluator.find_unusual_insider("MOVE", trades).has_value());
}

TEST_F(RuleEvaluatorTest, UnsymbolledTradeBelongsToQuery) {
    std::vector<InsiderTrade> trades = {make_trade("", TradeSide::Sell, 20000)};

    EXPECT_TRUE(evaluator.find_unusual_insider("MOVE", trades).has_value());
}

TEST_F(RuleEvaluatorTest, LargeSaleOnlyMatchesSells) {
    std::vector<InsiderTrade> trades = {
        make_trade("XYZ", TradeSide::Buy, 50000),
        make_trade("XYZ", TradeSide::Sell, 9999),
        make_trade("XYZ", TradeSide::Sell, 15000),
    };

    auto sale = evaluator.find_large_sale("XYZ", trades);

    ASSERT_TRUE(sale.has_value());
    EXPECT_EQ(sale->side, TradeSide::Sell);
    EXPECT_EQ(sale->shares, 15000);
}

TEST_F(RuleEvaluatorTest, UnusualDerivativeByRatioOrVolume) {
    DerivativeEvent by_ratio;
    by_ratio.underlying = "OPT";
    by_ratio.volume = 600;
    by_ratio.open_interest = 100;
    by_ratio.volume_oi_ratio = 6.0;

    DerivativeEvent by_volume;
    by_volume.underlying = "OPT";
    by_volume.volume = 5001;
    by_volume.volume_oi_ratio = 1.0;

    DerivativeEvent at_limits;
    at_limits.underlying = "OPT";
    at_limits.volume = 5000;
    at_limits.volume_oi_ratio = 5.0;

    EXPECT_TRUE(evaluator.is_unusual_derivative(by_ratio));
    EXPECT_TRUE(evaluator.is_unusual_derivative(by_volume));
    EXPECT_FALSE(evaluator.is_unusual_derivative(at_limits));
}
