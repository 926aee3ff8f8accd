#include <gtest/gtest.h>
#include "persistence/decision_ledger.hpp"
#include "utils/time_utils.hpp"
#include "chain_fixtures.hpp"
#include <filesystem>
#include <fstream>

using namespace wheel;
using namespace wheel::testing_support;
using time_utils::make_date;

class DecisionLedgerTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    std::string path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("wheel_ledger_") + info->name());
        std::filesystem::remove_all(dir_);
        path_ = (dir_ / "decisions.jsonl").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    RollDecision roll_decision() const {
        RollDecision d;
        d.slot_id = 2;
        d.action = DecisionAction::ROLL;
        d.trigger = DecisionTrigger::DELTA_BREACH;
        d.reason = "delta 0.72 >= 0.70";
        d.snapshot["delta"] = -0.72;

        TargetContract t;
        t.contract_id = "F 20261127P00011000";
        t.right = OptionRight::PUT;
        t.strike = 11.0;
        t.expiration = make_date(2026, 11, 27);
        t.delta = -0.32;
        t.limit_price = 0.26;
        d.target_contract = t;
        return d;
    }
};

// ============================================================================
// Recording
// ============================================================================

TEST_F(DecisionLedgerTest, CreatesDirectoryAndOpens) {
    DecisionLedger ledger(path_);

    EXPECT_TRUE(ledger.is_open());
    EXPECT_TRUE(std::filesystem::exists(dir_));
    EXPECT_EQ(ledger.current_path(), path_);
}

TEST_F(DecisionLedgerTest, RecordsDecisionWithTarget) {
    DecisionLedger ledger(path_);
    ledger.record_decision(7, roll_decision(), at_noon(make_date(2026, 10, 19)));
    ledger.flush();

    auto entries = ledger.read_entries("decision");
    ASSERT_EQ(entries.size(), 1u);

    const auto& j = entries[0];
    EXPECT_EQ(j["cycle"], 7);
    EXPECT_EQ(j["data"]["slot_id"], 2);
    EXPECT_EQ(j["data"]["action"], "ROLL");
    EXPECT_EQ(j["data"]["trigger"], "DELTA_BREACH");
    EXPECT_EQ(j["data"]["target_contract"]["expiration"], "2026-11-27");
    EXPECT_DOUBLE_EQ(j["data"]["target_contract"]["limit_price"].get<double>(), 0.26);
    EXPECT_DOUBLE_EQ(j["data"]["snapshot"]["delta"].get<double>(), -0.72);
}

TEST_F(DecisionLedgerTest, HoldDecisionHasNoTarget) {
    DecisionLedger ledger(path_);
    RollDecision hold;
    hold.slot_id = 0;
    hold.reason = "delta in range";
    ledger.record_decision(1, hold, at_noon(make_date(2026, 10, 19)));
    ledger.flush();

    auto entries = ledger.read_entries("decision");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["data"]["action"], "HOLD");
    EXPECT_FALSE(entries[0]["data"].contains("target_contract"));
}

TEST_F(DecisionLedgerTest, FiltersByEventType) {
    DecisionLedger ledger(path_);
    WallClock t = at_noon(make_date(2026, 10, 19));

    PortfolioState portfolio;
    portfolio.cash_balance = 50000.0;
    portfolio.shares_held = 400.0;
    portfolio.target_shares = 1000;
    portfolio.allocation_bias = -0.6;
    ledger.record_cycle(1, t, portfolio, {0});

    ConditionReport report;
    report.type = ConditionType::STALE_MARKET_DATA;
    report.slot_id = 3;
    report.reason = "quote age 400s";
    report.time = t;
    ledger.record_report(report);

    Order order;
    order.client_order_id = "WR-1";
    order.slot_id = 3;
    order.purpose = OrderPurpose::ROLL_CLOSE;
    order.side = Side::BUY;
    order.quantity = 1;
    order.limit_price = 0.40;
    ledger.record_order(order);

    ledger.record_decision(1, roll_decision(), t);
    ledger.flush();

    EXPECT_EQ(ledger.read_entries().size(), 4u);

    auto cycles = ledger.read_entries("cycle");
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_DOUBLE_EQ(cycles[0]["data"]["bias"].get<double>(), -0.6);
    EXPECT_EQ(cycles[0]["data"]["retired_slots"], nlohmann::json::array({0}));

    auto reports = ledger.read_entries("report");
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0]["data"]["type"], "STALE_MARKET_DATA");
    EXPECT_EQ(reports[0]["data"]["fatal"], false);

    auto orders = ledger.read_entries("order");
    ASSERT_EQ(orders.size(), 1u);
    EXPECT_EQ(orders[0]["data"]["purpose"], "ROLL_CLOSE");
    EXPECT_EQ(orders[0]["data"]["side"], "BUY");
}

// ============================================================================
// File management
// ============================================================================

TEST_F(DecisionLedgerTest, AppendsAcrossReopen) {
    {
        DecisionLedger ledger(path_);
        ledger.record_event("startup", {{"mode", "PAPER"}});
    }

    DecisionLedger reopened(path_);
    reopened.record_event("shutdown", {{"cycles", 3}});
    reopened.flush();

    EXPECT_EQ(reopened.read_entries().size(), 2u);
    EXPECT_GT(reopened.file_size(), 0u);
}

TEST_F(DecisionLedgerTest, RotateStartsFreshFile) {
    DecisionLedger ledger(path_);
    ledger.record_event("startup", {{"mode", "PAPER"}});
    ledger.rotate();
    ledger.record_event("shutdown", {{"cycles", 1}});
    ledger.flush();

    auto entries = ledger.read_entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["event_type"], "shutdown");

    int files = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir_)) {
        if (e.path().filename().string().rfind("decisions.jsonl", 0) == 0) files++;
    }
    EXPECT_EQ(files, 2);
}

TEST_F(DecisionLedgerTest, SkipsMalformedLines) {
    std::filesystem::create_directories(dir_);
    {
        std::ofstream out(path_);
        out << "{not json\n";
    }

    DecisionLedger ledger(path_);
    ledger.record_event("startup", {{"mode", "DRY_RUN"}});
    ledger.flush();

    auto entries = ledger.read_entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["data"]["mode"], "DRY_RUN");
}
