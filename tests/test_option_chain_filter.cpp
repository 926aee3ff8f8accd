#include <gtest/gtest.h>
#include "chain/option_chain_filter.hpp"
#include "utils/time_utils.hpp"
#include "chain_fixtures.hpp"

using namespace wheel;
using namespace wheel::testing_support;
using time_utils::make_date;

class OptionChainFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        filter_config_.expiry_tolerance_days = 2;
        filter_config_.min_bid = 0.01;
        filter_config_.max_spread_abs = 0.50;
        filter_config_.max_spread_fraction = 0.50;
        filter_ = std::make_unique<OptionChainFilter>(filter_config_, strategy_);

        expiry_ = make_date(2026, 10, 30);
        now_ = at_noon(make_date(2026, 10, 19));
        ladder_ = weekly_ladder(expiry_, now_);
    }

    std::optional<ContractSelection> select(OptionRight right, double target,
                                            const std::vector<OptionContract>& candidates) {
        PositionRebalancer rebalancer(strategy_);
        return filter_->select_contract(candidates, right, rebalancer.delta_band(target), 12.0,
                                        [](const OptionContract& c) { return c.delta; });
    }

    ChainFilterConfig filter_config_;
    StrategyConfig strategy_;
    std::unique_ptr<OptionChainFilter> filter_;
    Date expiry_{};
    WallClock now_;
    std::vector<OptionContract> ladder_;
};

// ============================================================================
// Expiration matching
// ============================================================================

TEST_F(OptionChainFilterTest, MatchExpiration_ExactDate) {
    auto target = make_date(2026, 10, 23);
    std::vector<Date> available{make_date(2026, 10, 22), target, make_date(2026, 10, 30)};

    EXPECT_EQ(filter_->match_expiration(target, available), target);
}

TEST_F(OptionChainFilterTest, MatchExpiration_NearestWithinTolerance) {
    auto target = make_date(2026, 10, 23);  // Friday holiday, Thursday listed
    std::vector<Date> available{make_date(2026, 10, 22), make_date(2026, 10, 30)};

    EXPECT_EQ(filter_->match_expiration(target, available), make_date(2026, 10, 22));
}

TEST_F(OptionChainFilterTest, MatchExpiration_TieGoesToLaterDate) {
    auto target = make_date(2026, 10, 23);
    std::vector<Date> available{make_date(2026, 10, 21), make_date(2026, 10, 25)};

    EXPECT_EQ(filter_->match_expiration(target, available), make_date(2026, 10, 25));
}

TEST_F(OptionChainFilterTest, MatchExpiration_NothingOutsideTolerance) {
    auto target = make_date(2026, 10, 23);
    std::vector<Date> available{make_date(2026, 10, 19), make_date(2026, 10, 27)};

    EXPECT_FALSE(filter_->match_expiration(target, available).has_value());
    EXPECT_FALSE(filter_->match_expiration(target, {}).has_value());
}

// ============================================================================
// Liquidity
// ============================================================================

TEST_F(OptionChainFilterTest, Liquidity_AcceptsTightQuotes) {
    for (const auto& c : ladder_) {
        EXPECT_TRUE(filter_->passes_liquidity(c)) << c.contract_id;
    }
}

TEST_F(OptionChainFilterTest, Liquidity_RejectsBadQuotes) {
    auto no_bid = make_option(OptionRight::PUT, 11.0, expiry_, -0.3, 0.0, 0.05, now_);
    auto crossed = make_option(OptionRight::PUT, 11.0, expiry_, -0.3, 0.30, 0.25, now_);
    auto wide = make_option(OptionRight::PUT, 11.0, expiry_, -0.3, 1.00, 1.60, now_);
    auto wide_fraction = make_option(OptionRight::PUT, 11.0, expiry_, -0.3, 0.02, 0.10, now_);

    EXPECT_FALSE(filter_->passes_liquidity(no_bid));
    EXPECT_FALSE(filter_->passes_liquidity(crossed));
    EXPECT_FALSE(filter_->passes_liquidity(wide));
    EXPECT_FALSE(filter_->passes_liquidity(wide_fraction));
}

TEST_F(OptionChainFilterTest, Liquidity_MinimumOpenInterest) {
    filter_config_.min_open_interest = 5000;
    OptionChainFilter strict(filter_config_, strategy_);

    EXPECT_FALSE(strict.passes_liquidity(ladder_[0]));
}

TEST_F(OptionChainFilterTest, FilterForExpiration_ExplainsIneligibility) {
    auto chain = make_chain({expiry_}, now_);

    auto missing = filter_->filter_for_expiration(chain, 2, make_date(2026, 11, 6));
    EXPECT_FALSE(missing.eligible());
    EXPECT_NE(missing.reason.find("no expiration"), std::string::npos);

    for (auto& c : chain.contracts) c.bid = 0.0;
    auto illiquid = filter_->filter_for_expiration(chain, 1, expiry_);
    EXPECT_FALSE(illiquid.eligible());
    EXPECT_EQ(illiquid.matched_expiration, expiry_);
    EXPECT_NE(illiquid.reason.find("liquidity"), std::string::npos);
}

TEST_F(OptionChainFilterTest, Filter_OneEntryPerWindowSlot) {
    ScheduleManager schedule(3, 5, 2);
    schedule.initialize(make_date(2026, 10, 23));
    auto chain = make_chain({make_date(2026, 10, 23), make_date(2026, 11, 6)}, now_);

    auto out = filter_->filter(chain, schedule.window());

    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(out.at(0).eligible());
    EXPECT_FALSE(out.at(1).eligible());
    EXPECT_TRUE(out.at(2).eligible());
    EXPECT_EQ(out.at(2).contracts.size(), 6u);
}

// ============================================================================
// Contract selection
// ============================================================================

TEST_F(OptionChainFilterTest, Select_ClosestToTargetForEachSide) {
    auto put = select(OptionRight::PUT, 0.32, ladder_);
    ASSERT_TRUE(put.has_value());
    EXPECT_DOUBLE_EQ(put->contract.strike, 11.0);
    EXPECT_TRUE(put->in_band);

    auto neutral_put = select(OptionRight::PUT, 0.20, ladder_);
    ASSERT_TRUE(neutral_put.has_value());
    EXPECT_DOUBLE_EQ(neutral_put->contract.strike, 10.5);

    auto call = select(OptionRight::CALL, 0.32, ladder_);
    ASSERT_TRUE(call.has_value());
    EXPECT_DOUBLE_EQ(call->contract.strike, 13.0);
}

TEST_F(OptionChainFilterTest, Select_OnlyOutOfTheMoney) {
    ladder_.push_back(make_option(OptionRight::PUT, 12.5, expiry_, -0.42, 0.70, 0.74, now_));

    auto put = select(OptionRight::PUT, 0.42, ladder_);
    ASSERT_TRUE(put.has_value());
    EXPECT_DOUBLE_EQ(put->contract.strike, 11.5);
}

TEST_F(OptionChainFilterTest, Select_StrikeDistanceLimit) {
    ladder_.push_back(make_option(OptionRight::PUT, 10.0, expiry_, -0.20, 0.08, 0.12, now_));

    auto put = select(OptionRight::PUT, 0.20, ladder_);
    ASSERT_TRUE(put.has_value());
    EXPECT_DOUBLE_EQ(put->contract.strike, 10.5);
}

TEST_F(OptionChainFilterTest, Select_DeltaLimits) {
    std::vector<OptionContract> candidates{
        make_option(OptionRight::CALL, 12.5, expiry_, 0.70, 0.60, 0.64, now_),
        make_option(OptionRight::CALL, 13.5, expiry_, 0.04, 0.02, 0.04, now_),
    };

    EXPECT_FALSE(select(OptionRight::CALL, 0.32, candidates).has_value());
}

TEST_F(OptionChainFilterTest, Select_InBandBeatsCloserOutOfBand) {
    std::vector<OptionContract> candidates{
        make_option(OptionRight::CALL, 12.5, expiry_, 0.455, 0.50, 0.54, now_),
        make_option(OptionRight::CALL, 13.0, expiry_, 0.38, 0.30, 0.34, now_),
    };

    // Band around 0.42 is capped at 0.45
    auto call = select(OptionRight::CALL, 0.42, candidates);
    ASSERT_TRUE(call.has_value());
    EXPECT_DOUBLE_EQ(call->contract.strike, 13.0);
    EXPECT_TRUE(call->in_band);
}

TEST_F(OptionChainFilterTest, Select_RicherMidBreaksTies) {
    ladder_.push_back(make_option(OptionRight::PUT, 11.25, expiry_, -0.32, 0.30, 0.34, now_));

    auto put = select(OptionRight::PUT, 0.32, ladder_);
    ASSERT_TRUE(put.has_value());
    EXPECT_DOUBLE_EQ(put->contract.strike, 11.25);
}

TEST_F(OptionChainFilterTest, Select_CleanStrikesOnly) {
    strategy_.clean_strikes_only = true;
    filter_ = std::make_unique<OptionChainFilter>(filter_config_, strategy_);
    ladder_.push_back(make_option(OptionRight::PUT, 11.25, expiry_, -0.32, 0.30, 0.34, now_));

    auto put = select(OptionRight::PUT, 0.32, ladder_);
    ASSERT_TRUE(put.has_value());
    EXPECT_DOUBLE_EQ(put->contract.strike, 11.0);
}

TEST_F(OptionChainFilterTest, Select_NothingWithoutUnderlying) {
    PositionRebalancer rebalancer(strategy_);
    auto none = filter_->select_contract(ladder_, OptionRight::PUT, rebalancer.delta_band(0.32), 0.0,
                                         [](const OptionContract& c) { return c.delta; });
    EXPECT_FALSE(none.has_value());
}

TEST_F(OptionChainFilterTest, CleanStrike) {
    EXPECT_TRUE(OptionChainFilter::is_clean_strike(10.0));
    EXPECT_TRUE(OptionChainFilter::is_clean_strike(10.5));
    EXPECT_FALSE(OptionChainFilter::is_clean_strike(10.25));
    EXPECT_FALSE(OptionChainFilter::is_clean_strike(11.75));
}
