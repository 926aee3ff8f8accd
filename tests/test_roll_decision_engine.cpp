#include <gtest/gtest.h>
#include "engine/roll_decision_engine.hpp"
#include "utils/time_utils.hpp"
#include "chain_fixtures.hpp"

using namespace wheel;
using namespace wheel::testing_support;
using time_utils::make_date;

class RollDecisionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy_.target_shares = 1000;
        strategy_.num_slots = 5;
        strategy_.roll_delta_threshold = 0.70;
        strategy_.min_days_to_expiry = 1;

        schedule_ = std::make_unique<ScheduleManager>(5, 5, 2);
        schedule_->initialize(make_date(2026, 10, 23));

        set_today(make_date(2026, 10, 19));
        engine_ = std::make_unique<RollDecisionEngine>(strategy_, filter_config_, market_data_);
    }

    void set_today(Date today) {
        today_ = today;
        now_ = at_noon(today);
        chain_ = make_chain(all_expirations(), now_);
    }

    std::vector<Date> all_expirations() const {
        std::vector<Date> out;
        for (int i = 0; i < 6; ++i) {
            out.push_back(make_date(2026, 10, 23) + std::chrono::days(7 * i));
        }
        return out;
    }

    CycleSnapshot snapshot(std::vector<Position> positions, double cash = 50000.0, double shares = 400.0) const {
        CycleSnapshot s;
        PositionRebalancer rebalancer(strategy_);
        s.portfolio = rebalancer.assess(cash, shares, 0.0, 12.0, now_);
        s.positions = std::move(positions);
        s.window = schedule_->window();
        s.chain = chain_;
        s.now = now_;
        s.today = today_;
        return s;
    }

    RollDecisionEngine make_engine() const {
        return RollDecisionEngine(strategy_, filter_config_, market_data_);
    }

    StrategyConfig strategy_;
    ChainFilterConfig filter_config_;
    MarketDataConfig market_data_;
    std::unique_ptr<ScheduleManager> schedule_;
    std::unique_ptr<RollDecisionEngine> engine_;
    Date today_{};
    WallClock now_;
    ChainSnapshot chain_;
};

// ============================================================================
// Walkthrough scenarios
// ============================================================================

TEST_F(RollDecisionEngineTest, Scenario_InRangeLegHolds) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 10.5, make_date(2026, 10, 23), -0.25)});

    auto batch = engine_->evaluate(s);

    ASSERT_EQ(batch.decisions.size(), 5u);
    const auto* d = batch.for_slot(0);
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->action, DecisionAction::HOLD);
    EXPECT_EQ(d->trigger, DecisionTrigger::NONE);
    EXPECT_FALSE(d->target_contract.has_value());
    EXPECT_DOUBLE_EQ(d->snapshot.at("days_to_expiry"), 4.0);
    EXPECT_FALSE(batch.has_report(ConditionType::STALE_MARKET_DATA, 0));
}

TEST_F(RollDecisionEngineTest, Scenario_DeltaBreachRollsEarliestSlotPastWindow) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.72)});

    auto batch = engine_->evaluate(s);
    const auto* d = batch.for_slot(0);

    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->action, DecisionAction::ROLL);
    EXPECT_EQ(d->trigger, DecisionTrigger::DELTA_BREACH);
    ASSERT_TRUE(d->target_contract.has_value());
    EXPECT_EQ(d->target_contract->right, OptionRight::PUT);
    EXPECT_DOUBLE_EQ(d->target_contract->strike, 11.0);
    EXPECT_NEAR(d->target_contract->delta, -0.32, 1e-12);
    EXPECT_EQ(d->target_contract->expiration, make_date(2026, 11, 27));
    EXPECT_NEAR(d->target_contract->limit_price, 0.26, 1e-9);
    EXPECT_NEAR(d->snapshot.at("target_delta"), 0.32, 1e-12);
    EXPECT_NEAR(d->snapshot.at("bias"), -0.6, 1e-12);
    EXPECT_DOUBLE_EQ(d->snapshot.at("delta"), -0.72);
}

TEST_F(RollDecisionEngineTest, Scenario_ExpiryDayRolls) {
    set_today(make_date(2026, 10, 23));
    auto s = snapshot({make_position(0, OptionRight::PUT, 10.5, make_date(2026, 10, 23), -0.15)});

    auto batch = engine_->evaluate(s);
    const auto* d = batch.for_slot(0);

    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->action, DecisionAction::ROLL);
    EXPECT_EQ(d->trigger, DecisionTrigger::EXPIRY_PROXIMITY);
    ASSERT_TRUE(d->target_contract.has_value());
    EXPECT_EQ(d->target_contract->expiration, make_date(2026, 11, 27));
}

TEST_F(RollDecisionEngineTest, Scenario_MissingExpirationBlocksOnlyThatSlot) {
    std::vector<Date> expirations = all_expirations();
    expirations.erase(expirations.begin() + 2);  // 2026-11-06
    chain_ = make_chain(expirations, now_);

    auto batch = engine_->evaluate(snapshot({}));

    EXPECT_EQ(batch.for_slot(2)->action, DecisionAction::HOLD);
    EXPECT_TRUE(batch.has_report(ConditionType::NO_ELIGIBLE_CONTRACT, 2));
    for (int slot : {0, 1, 3, 4}) {
        EXPECT_EQ(batch.for_slot(slot)->action, DecisionAction::OPEN) << "slot " << slot;
        EXPECT_FALSE(batch.has_report(ConditionType::NO_ELIGIBLE_CONTRACT, slot));
    }
}

// ============================================================================
// Rule properties
// ============================================================================

TEST_F(RollDecisionEngineTest, NearMoneyNeverHolds) {
    for (int i = 70; i < 100; ++i) {
        double delta = -i / 100.0;
        auto s = snapshot({make_position(1, OptionRight::PUT, 11.5, make_date(2026, 10, 30), delta)});

        auto batch = engine_->evaluate(s);
        EXPECT_EQ(batch.for_slot(1)->action, DecisionAction::ROLL) << "delta " << delta;
    }
}

TEST_F(RollDecisionEngineTest, InnerSlotRestrikesInItsOwnWeek) {
    auto s = snapshot({make_position(2, OptionRight::PUT, 11.5, make_date(2026, 11, 6), -0.75)});

    auto batch = engine_->evaluate(s);
    const auto* d = batch.for_slot(2);

    ASSERT_EQ(d->action, DecisionAction::ROLL);
    EXPECT_EQ(d->target_contract->expiration, make_date(2026, 11, 6));
}

TEST_F(RollDecisionEngineTest, AppliedRollIsStable) {
    auto first = engine_->evaluate(
        snapshot({make_position(2, OptionRight::PUT, 11.5, make_date(2026, 11, 6), -0.75)}));
    const auto& target = *first.for_slot(2)->target_contract;

    Position replaced = make_position(2, target.right, target.strike, target.expiration, target.delta);
    auto second = engine_->evaluate(snapshot({replaced}));

    EXPECT_EQ(second.for_slot(2)->action, DecisionAction::HOLD);
}

TEST_F(RollDecisionEngineTest, StaleLegHoldsWithReport) {
    Position pos = make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.90);
    pos.stale = true;

    auto batch = engine_->evaluate(snapshot({pos}));

    EXPECT_EQ(batch.for_slot(0)->action, DecisionAction::HOLD);
    EXPECT_TRUE(batch.has_report(ConditionType::STALE_MARKET_DATA, 0));
}

TEST_F(RollDecisionEngineTest, DecisionsSortedBySlot) {
    auto batch = engine_->evaluate(snapshot({}, 50000.0, 1000.0));

    ASSERT_EQ(batch.decisions.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(batch.decisions[i].slot_id, i);
    }
}

TEST_F(RollDecisionEngineTest, OpenLimitPriceIsRoundedMid) {
    chain_.contracts[1].bid = 0.241;
    chain_.contracts[1].ask = 0.284;

    auto batch = engine_->evaluate(snapshot({}));
    const auto* d = batch.for_slot(0);

    ASSERT_EQ(d->action, DecisionAction::OPEN);
    EXPECT_EQ(d->trigger, DecisionTrigger::EMPTY_SLOT);
    EXPECT_DOUBLE_EQ(d->target_contract->strike, 11.0);
    EXPECT_NEAR(d->target_contract->limit_price, 0.26, 1e-9);
}

// ============================================================================
// Slot guards
// ============================================================================

TEST_F(RollDecisionEngineTest, HaltedSlotHoldsSilently) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.90)});
    s.halted_slots.insert(0);

    auto batch = engine_->evaluate(s);

    EXPECT_EQ(batch.for_slot(0)->action, DecisionAction::HOLD);
    for (const auto& r : batch.reports) {
        EXPECT_NE(r.slot_id, 0);
    }
}

TEST_F(RollDecisionEngineTest, DuplicateLegsAreFatalToSlot) {
    auto s = snapshot({
        make_position(1, OptionRight::PUT, 11.0, make_date(2026, 10, 30), -0.30),
        make_position(1, OptionRight::PUT, 10.5, make_date(2026, 10, 30), -0.20),
    });

    auto batch = engine_->evaluate(s);

    EXPECT_EQ(batch.for_slot(1)->action, DecisionAction::HOLD);
    ASSERT_TRUE(batch.has_report(ConditionType::INVARIANT_VIOLATION, 1));
    EXPECT_EQ(batch.halt_requests, std::set<int>{1});
    for (const auto& r : batch.reports) {
        if (r.type == ConditionType::INVARIANT_VIOLATION) {
            EXPECT_TRUE(r.is_fatal);
            EXPECT_DOUBLE_EQ(r.snapshot.at("live_positions"), 2.0);
        }
    }
}

TEST_F(RollDecisionEngineTest, OrderInFlightHolds) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.90)});
    s.pending_order_slots.insert(0);

    auto batch = engine_->evaluate(s);

    EXPECT_EQ(batch.for_slot(0)->action, DecisionAction::HOLD);
    EXPECT_NE(batch.for_slot(0)->reason.find("awaiting"), std::string::npos);
}

TEST_F(RollDecisionEngineTest, PendingRollStatusHolds) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.90,
                                     PositionStatus::PENDING_ROLL)});

    EXPECT_EQ(engine_->evaluate(s).for_slot(0)->action, DecisionAction::HOLD);
}

TEST_F(RollDecisionEngineTest, OrderlessPlaceholderReopens) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), 0.0,
                                     PositionStatus::PENDING_OPEN)});

    EXPECT_EQ(engine_->evaluate(s).for_slot(0)->action, DecisionAction::OPEN);

    s.pending_order_slots.insert(0);
    EXPECT_EQ(engine_->evaluate(s).for_slot(0)->action, DecisionAction::HOLD);
}

TEST_F(RollDecisionEngineTest, DisconnectedBrokerHoldsEverything) {
    auto s = snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.90)});
    s.broker_connected = false;

    auto batch = engine_->evaluate(s);

    ASSERT_EQ(batch.decisions.size(), 5u);
    EXPECT_EQ(batch.action_count(), 0u);
    EXPECT_TRUE(batch.has_report(ConditionType::BROKER_DISCONNECTED, -1));
    EXPECT_EQ(batch.reports.size(), 1u);
}

// ============================================================================
// Collateral
// ============================================================================

TEST_F(RollDecisionEngineTest, CollateralReservedAcrossBatch) {
    auto batch = engine_->evaluate(snapshot({}, 2500.0));

    EXPECT_EQ(batch.for_slot(0)->action, DecisionAction::OPEN);
    EXPECT_EQ(batch.for_slot(1)->action, DecisionAction::OPEN);
    for (int slot : {2, 3, 4}) {
        EXPECT_EQ(batch.for_slot(slot)->action, DecisionAction::HOLD);
        EXPECT_TRUE(batch.has_report(ConditionType::INSUFFICIENT_COLLATERAL, slot));
    }
}

TEST_F(RollDecisionEngineTest, LiveLegsCommitCollateral) {
    auto held = snapshot({make_position(0, OptionRight::PUT, 11.0, make_date(2026, 10, 23), -0.30)}, 2300.0);
    auto batch = engine_->evaluate(held);
    EXPECT_EQ(batch.action_count(), 1u);
    EXPECT_EQ(batch.for_slot(1)->action, DecisionAction::OPEN);

    // An unfilled placeholder with no order behind it commits nothing
    auto placeholder = snapshot({make_position(0, OptionRight::PUT, 11.0, make_date(2026, 10, 23), 0.0,
                                               PositionStatus::PENDING_OPEN)}, 2300.0);
    batch = engine_->evaluate(placeholder);
    EXPECT_EQ(batch.action_count(), 2u);
    EXPECT_EQ(batch.for_slot(0)->action, DecisionAction::OPEN);
    EXPECT_EQ(batch.for_slot(1)->action, DecisionAction::OPEN);
}

TEST_F(RollDecisionEngineTest, CoveredCallsLimitedByShares) {
    strategy_.target_shares = 100;
    auto engine = make_engine();

    // bias +0.5: calls only, farthest slots first
    auto batch = engine.evaluate(snapshot({}, 50000.0, 150.0));

    EXPECT_EQ(batch.action_count(), 1u);
    const auto* d = batch.for_slot(4);
    ASSERT_EQ(d->action, DecisionAction::OPEN);
    EXPECT_EQ(d->target_contract->right, OptionRight::CALL);
    EXPECT_DOUBLE_EQ(d->target_contract->strike, 13.0);
    EXPECT_TRUE(batch.has_report(ConditionType::INSUFFICIENT_COLLATERAL, 0));
}

TEST_F(RollDecisionEngineTest, NeutralBiasAlternatesSides) {
    auto batch = engine_->evaluate(snapshot({}, 50000.0, 1000.0));

    EXPECT_EQ(batch.for_slot(0)->target_contract->right, OptionRight::PUT);
    EXPECT_DOUBLE_EQ(batch.for_slot(0)->target_contract->strike, 10.5);
    EXPECT_EQ(batch.for_slot(1)->target_contract->right, OptionRight::CALL);
    EXPECT_DOUBLE_EQ(batch.for_slot(1)->target_contract->strike, 13.5);
    EXPECT_EQ(batch.for_slot(2)->target_contract->right, OptionRight::PUT);
}

TEST_F(RollDecisionEngineTest, UnfundedRollCloses) {
    auto s = snapshot({make_position(1, OptionRight::PUT, 10.5, make_date(2026, 10, 30), -0.75)}, 0.0);

    auto batch = engine_->evaluate(s);
    const auto* d = batch.for_slot(1);

    EXPECT_EQ(d->action, DecisionAction::CLOSE);
    EXPECT_EQ(d->trigger, DecisionTrigger::DELTA_BREACH);
    EXPECT_FALSE(d->target_contract.has_value());
    EXPECT_TRUE(batch.has_report(ConditionType::INSUFFICIENT_COLLATERAL, 1));
}

TEST_F(RollDecisionEngineTest, RollWithoutReplacementHolds) {
    std::vector<Date> expirations = all_expirations();
    expirations.pop_back();  // 2026-11-27
    chain_ = make_chain(expirations, now_);

    auto batch = engine_->evaluate(
        snapshot({make_position(0, OptionRight::PUT, 11.5, make_date(2026, 10, 23), -0.80)}));

    EXPECT_EQ(batch.for_slot(0)->action, DecisionAction::HOLD);
    EXPECT_TRUE(batch.has_report(ConditionType::NO_ELIGIBLE_CONTRACT, 0));
}

// ============================================================================
// Profit target and cancellation
// ============================================================================

TEST_F(RollDecisionEngineTest, ProfitTargetCloses) {
    strategy_.close_profit_fraction = 0.5;
    auto engine = make_engine();

    Position pos = make_position(1, OptionRight::PUT, 10.5, make_date(2026, 10, 30), -0.10);
    pos.open_price = 0.40;
    pos.mark_price = 0.15;

    auto batch = engine.evaluate(snapshot({pos}));
    const auto* d = batch.for_slot(1);

    EXPECT_EQ(d->action, DecisionAction::CLOSE);
    EXPECT_EQ(d->trigger, DecisionTrigger::PROFIT_TARGET);
    EXPECT_NEAR(d->snapshot.at("captured_fraction"), 0.625, 1e-12);

    // Disabled by default
    EXPECT_EQ(engine_->evaluate(snapshot({pos})).for_slot(1)->action, DecisionAction::HOLD);
}

TEST_F(RollDecisionEngineTest, ShouldCancel_OnlyRecoveredDeltaRolls) {
    Position pos = make_position(1, OptionRight::PUT, 11.0, make_date(2026, 10, 30), -0.40);

    EXPECT_TRUE(engine_->should_cancel(DecisionTrigger::DELTA_BREACH, pos, today_));
    EXPECT_FALSE(engine_->should_cancel(DecisionTrigger::EXPIRY_PROXIMITY, pos, today_));

    pos.delta = -0.75;
    EXPECT_FALSE(engine_->should_cancel(DecisionTrigger::DELTA_BREACH, pos, today_));

    pos.delta = -0.40;
    pos.stale = true;
    EXPECT_FALSE(engine_->should_cancel(DecisionTrigger::DELTA_BREACH, pos, today_));

    pos.stale = false;
    EXPECT_FALSE(engine_->should_cancel(DecisionTrigger::DELTA_BREACH, pos, make_date(2026, 10, 29)));
}
