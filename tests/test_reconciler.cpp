#include <gtest/gtest.h>
#include <algorithm>
#include "core/reconciler.hpp"
#include "broker/paper_broker.hpp"
#include "utils/time_utils.hpp"
#include "chain_fixtures.hpp"

using namespace wheel;
using namespace wheel::testing_support;
using time_utils::make_date;

class ReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy_.symbol = "F";
        strategy_.num_slots = 5;
        chain_filter_.expiry_tolerance_days = 2;

        today_ = make_date(2026, 10, 19);
        now_ = at_noon(today_);

        PaperBroker::Config pc;
        pc.symbol = "F";
        pc.starting_cash = 40000.0;
        pc.starting_shares = 300.0;
        broker_ = std::make_shared<PaperBroker>(pc);
        broker_->set_clock([this] { return now_; });
        broker_->connect();

        schedule_ = std::make_unique<ScheduleManager>(5, 5, 2);
        reconciler_ = std::make_unique<Reconciler>(broker_, strategy_, chain_filter_);
    }

    void add_leg(OptionRight right, Price strike, Date expiration, int quantity = -1,
                 const std::string& symbol = "F") {
        BrokerPosition pos;
        pos.contract_id = make_contract_id(symbol, expiration, right, strike);
        pos.symbol = symbol;
        pos.is_option = true;
        pos.right = right;
        pos.strike = strike;
        pos.expiration = expiration;
        pos.quantity = quantity;
        pos.average_cost = 0.30;
        broker_->add_option_position(pos);
    }

    size_t count(const ReconciliationResult& r, DiscrepancyType type) const {
        return static_cast<size_t>(std::count_if(r.discrepancies.begin(), r.discrepancies.end(),
                                                 [type](const Discrepancy& d) { return d.type == type; }));
    }

    StrategyConfig strategy_;
    ChainFilterConfig chain_filter_;
    Date today_{};
    WallClock now_;
    std::shared_ptr<PaperBroker> broker_;
    std::unique_ptr<ScheduleManager> schedule_;
    std::unique_ptr<Reconciler> reconciler_;
    PositionBook book_;
};

// ============================================================================
// Flat account
// ============================================================================

TEST_F(ReconcilerTest, FlatAccount_UsesDefaultAnchor) {
    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.anchor, make_date(2026, 10, 30));
    EXPECT_TRUE(schedule_->initialized());
    EXPECT_EQ(schedule_->window().earliest(), make_date(2026, 10, 30));
    EXPECT_EQ(result.positions_synced, 0);
    EXPECT_TRUE(result.discrepancies.empty());
    EXPECT_DOUBLE_EQ(result.balances.cash, 40000.0);
    EXPECT_DOUBLE_EQ(result.balances.shares_held, 300.0);
    EXPECT_NE(result.summary().find("Reconciliation SUCCESS"), std::string::npos);
}

// ============================================================================
// Slot mapping
// ============================================================================

TEST_F(ReconcilerTest, Legs_MappedToSlotsFromEarliestLeg) {
    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 23));
    add_leg(OptionRight::CALL, 13.0, make_date(2026, 10, 30));
    add_leg(OptionRight::PUT, 10.5, make_date(2026, 11, 6));

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.anchor, make_date(2026, 10, 23));
    EXPECT_EQ(result.positions_synced, 3);
    EXPECT_FALSE(result.has_critical_discrepancies());

    for (int slot = 0; slot < 3; ++slot) {
        auto pos = book_.live_position(slot);
        ASSERT_TRUE(pos.has_value()) << "slot " << slot;
        EXPECT_EQ(pos->status, PositionStatus::OPEN);
        EXPECT_EQ(pos->quantity, -1);
        EXPECT_DOUBLE_EQ(pos->open_price, 0.30);
    }
    EXPECT_EQ(book_.live_position(1)->right, OptionRight::CALL);
    EXPECT_FALSE(book_.live_position(3).has_value());
}

TEST_F(ReconcilerTest, Legs_HolidayShiftedExpirationAnchorsItsWeek) {
    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 22));   // Thursday

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    EXPECT_EQ(result.anchor, make_date(2026, 10, 23));
    ASSERT_TRUE(book_.live_position(0).has_value());
    EXPECT_EQ(book_.live_position(0)->expiration, make_date(2026, 10, 22));
}

TEST_F(ReconcilerTest, Legs_OtherUnderlyingsIgnored) {
    add_leg(OptionRight::PUT, 50.0, make_date(2026, 10, 23), -1, "GM");

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    EXPECT_EQ(result.anchor, make_date(2026, 10, 30));
    EXPECT_EQ(result.positions_synced, 0);
    EXPECT_TRUE(result.discrepancies.empty());
}

// ============================================================================
// Discrepancies
// ============================================================================

TEST_F(ReconcilerTest, DuplicateLeg_HaltsSlot) {
    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 23));
    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 30));
    add_leg(OptionRight::PUT, 10.5, make_date(2026, 10, 30));

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.has_critical_discrepancies());
    EXPECT_EQ(count(result, DiscrepancyType::DUPLICATE_SLOT_LEG), 2u);
    EXPECT_EQ(result.halted_slots, (std::set<int>{1}));
    EXPECT_TRUE(schedule_->is_halted(1));
    EXPECT_FALSE(schedule_->is_halted(0));

    ASSERT_EQ(result.reports.size(), 1u);
    EXPECT_EQ(result.reports[0].type, ConditionType::INVARIANT_VIOLATION);
    EXPECT_TRUE(result.reports[0].is_fatal);
    EXPECT_EQ(result.reports[0].slot_id, 1);

    // Both legs stay visible so the halted slot can be inspected
    EXPECT_EQ(book_.live_count(1), 2);
    EXPECT_EQ(result.positions_synced, 3);
}

TEST_F(ReconcilerTest, LegOutsideWindow_Unmanaged) {
    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 23));
    add_leg(OptionRight::PUT, 9.0, make_date(2027, 1, 15));

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.unmanaged, 1);
    EXPECT_EQ(count(result, DiscrepancyType::UNMANAGED_POSITION), 1u);
    EXPECT_FALSE(result.has_critical_discrepancies());
    EXPECT_EQ(result.positions_synced, 1);
}

TEST_F(ReconcilerTest, LongOption_ReportedNotAdopted) {
    add_leg(OptionRight::PUT, 10.0, make_date(2026, 10, 30), 2);

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(count(result, DiscrepancyType::LONG_OPTION), 1u);
    EXPECT_FALSE(result.has_critical_discrepancies());
    EXPECT_EQ(result.positions_synced, 0);
    EXPECT_EQ(result.anchor, make_date(2026, 10, 30));
}

TEST_F(ReconcilerTest, ExpiredLeg_AwaitingSettlement) {
    // A broker that has not posted last week's settlement yet
    PaperBroker::Config pc;
    pc.symbol = "F";
    pc.starting_cash = 40000.0;
    pc.auto_settle = false;
    broker_ = std::make_shared<PaperBroker>(pc);
    broker_->set_clock([this] { return now_; });
    broker_->connect();
    reconciler_ = std::make_unique<Reconciler>(broker_, strategy_, chain_filter_);

    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 16));

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(count(result, DiscrepancyType::AWAITING_SETTLEMENT), 1u);
    EXPECT_EQ(result.anchor, make_date(2026, 10, 30));
    EXPECT_EQ(result.positions_synced, 0);
}

TEST_F(ReconcilerTest, ExpiredLeg_SettledByPaperBroker) {
    add_leg(OptionRight::PUT, 13.0, make_date(2026, 10, 16));

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(count(result, DiscrepancyType::AWAITING_SETTLEMENT), 0u);
    EXPECT_DOUBLE_EQ(result.balances.shares_held, 400.0);
    EXPECT_DOUBLE_EQ(result.balances.cash, 40000.0 - 1300.0);
}

TEST_F(ReconcilerTest, FridayEveningStillTradesFridaysLeg) {
    // 22:00 New York on Friday 10-23 is already Saturday in UTC
    now_ = WallClock(make_date(2026, 10, 24).time_since_epoch()) + std::chrono::hours(2);
    add_leg(OptionRight::PUT, 11.0, make_date(2026, 10, 23));

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(count(result, DiscrepancyType::AWAITING_SETTLEMENT), 0u);
    EXPECT_EQ(result.anchor, make_date(2026, 10, 23));
    EXPECT_EQ(result.positions_synced, 1);
}

TEST_F(ReconcilerTest, DisconnectedBroker_Fails) {
    broker_->simulate_disconnect();

    auto result = reconciler_->reconcile(book_, *schedule_, now_);

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("not connected"), std::string::npos);
    EXPECT_FALSE(schedule_->initialized());
    EXPECT_NE(result.summary().find("Reconciliation FAILED"), std::string::npos);
}

TEST_F(ReconcilerTest, ChooseAnchor_SkipsExpiredLegs) {
    std::vector<BrokerPosition> legs(2);
    legs[0].expiration = make_date(2026, 10, 16);
    legs[1].expiration = make_date(2026, 11, 6);

    EXPECT_EQ(reconciler_->choose_anchor(legs, *schedule_, today_), make_date(2026, 11, 6));
    EXPECT_EQ(reconciler_->choose_anchor({}, *schedule_, today_), make_date(2026, 10, 30));
}
