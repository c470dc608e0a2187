#include <gtest/gtest.h>
#include "stake/stake_pool.hh"

namespace slp {
namespace {

constexpr lamports_t SOL = LAMPORTS_PER_SOL;

class StakePoolTest : public ::testing::Test {
protected:
    StakePoolConfig config_;
    StakePool pool_{config_};
};

TEST_F(StakePoolTest, EmptyPoolRateIsOneToOne) {
    EXPECT_EQ(pool_.state().exchange_rate(), PRICE_SCALE);
    EXPECT_EQ(pool_.venue_name(), "stake_pool");
}

TEST_F(StakePoolTest, FirstDepositMintsOneToOne) {
    StakeResult result = pool_.deposit(10 * SOL);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.amount_out, 10 * SOL);
    EXPECT_EQ(result.to_reserve, SOL);

    EXPECT_EQ(pool_.state().reserve_lamports, SOL);
    EXPECT_EQ(pool_.state().total_staked, 9 * SOL);
    EXPECT_EQ(pool_.state().slp_supply, 10 * SOL);
    EXPECT_EQ(pool_.state().exchange_rate(), PRICE_SCALE);
}

TEST_F(StakePoolTest, DepositBelowMinimum) {
    StakeResult result = pool_.deposit(StakePoolConfig::MIN_DEPOSIT - 1);
    EXPECT_EQ(result.error, ErrorCode::BELOW_MINIMUM_STAKE);
    EXPECT_EQ(pool_.state().slp_supply, 0u);
}

TEST_F(StakePoolTest, RewardsRaiseExchangeRate) {
    ASSERT_TRUE(pool_.deposit(10 * SOL).ok());

    EXPECT_EQ(pool_.accrue_rewards(Identity::from_label("anyone"), SOL), ErrorCode::UNAUTHORIZED);
    ASSERT_EQ(pool_.accrue_rewards(config_.authority, 10 * SOL), ErrorCode::OK);
    EXPECT_EQ(pool_.state().exchange_rate(), 2 * PRICE_SCALE);

    StakeResult second = pool_.deposit(10 * SOL);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.amount_out, 5 * SOL);
}

TEST_F(StakePoolTest, WithdrawPaysFromReserve) {
    ASSERT_TRUE(pool_.deposit(10 * SOL).ok());

    StakeResult result = pool_.withdraw(SOL);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.amount_out, SOL);
    EXPECT_EQ(pool_.state().reserve_lamports, 0u);
    EXPECT_EQ(pool_.state().slp_supply, 9 * SOL);
}

TEST_F(StakePoolTest, WithdrawBeyondReserve) {
    ASSERT_TRUE(pool_.deposit(10 * SOL).ok());
    StakePoolState before = pool_.state();

    EXPECT_EQ(pool_.withdraw(2 * SOL).error, ErrorCode::INSUFFICIENT_RESERVE);
    EXPECT_EQ(pool_.withdraw(11 * SOL).error, ErrorCode::INSUFFICIENT_BALANCE);
    EXPECT_EQ(pool_.withdraw(0).error, ErrorCode::INSUFFICIENT_INPUT);
    EXPECT_EQ(pool_.state(), before);
}

TEST_F(StakePoolTest, PausedPoolRejectsEverything) {
    ASSERT_TRUE(pool_.deposit(10 * SOL).ok());
    EXPECT_EQ(pool_.set_paused(Identity::from_label("anyone"), true), ErrorCode::UNAUTHORIZED);
    ASSERT_EQ(pool_.set_paused(config_.authority, true), ErrorCode::OK);

    EXPECT_EQ(pool_.deposit(SOL).error, ErrorCode::POOL_PAUSED);
    EXPECT_EQ(pool_.withdraw(SOL).error, ErrorCode::POOL_PAUSED);
}

TEST_F(StakePoolTest, ExecutionTargetMapsIntents) {
    ExecutionTarget& target = pool_;

    ExecutionQuote staked = target.execute(IntentKind::STAKE, 10 * SOL);
    ASSERT_TRUE(staked.ok());
    EXPECT_EQ(staked.amount_out, 10 * SOL);
    EXPECT_EQ(staked.fee, 0u);

    ExecutionQuote quote = target.quote(IntentKind::UNSTAKE, SOL / 2);
    ASSERT_TRUE(quote.ok());
    ExecutionQuote unstaked = target.execute(IntentKind::UNSTAKE, SOL / 2);
    ASSERT_TRUE(unstaked.ok());
    EXPECT_EQ(unstaked.amount_out, quote.amount_out);
}

}  // namespace
}  // namespace slp
