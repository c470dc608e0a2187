#include <gtest/gtest.h>
#include "amm/pool.hh"

namespace slp {
namespace {

constexpr lamports_t SOL = LAMPORTS_PER_SOL;

class AmmPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(pool_.add_liquidity(provider_, 1000 * SOL, 1000 * SOL).ok());
    }

    MarketConfig config_;
    AmmPool pool_{config_};
    Identity provider_ = Identity::from_label("provider");
    Identity stranger_ = Identity::from_label("stranger");
};

// ============================================================================
// Liquidity
// ============================================================================

TEST_F(AmmPoolTest, InitialDepositCreditsProvider) {
    EXPECT_EQ(pool_.lp_balance(provider_), 1000 * SOL - MINIMUM_LIQUIDITY);
    EXPECT_EQ(pool_.state().lp_supply, 1000 * SOL);
    EXPECT_EQ(pool_.lp_balance(stranger_), 0u);
}

TEST_F(AmmPoolTest, RemoveLiquidityRequiresBalance) {
    WithdrawResult denied = pool_.remove_liquidity(stranger_, SOL);
    EXPECT_EQ(denied.error, ErrorCode::INSUFFICIENT_BALANCE);

    WithdrawResult result = pool_.remove_liquidity(provider_, 100 * SOL);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.amount_a, 100 * SOL);
    EXPECT_EQ(pool_.lp_balance(provider_), 900 * SOL - MINIMUM_LIQUIDITY);
}

TEST_F(AmmPoolTest, ProviderCannotDrainLockedLiquidity) {
    std::uint64_t all = pool_.lp_balance(provider_);
    WithdrawResult result = pool_.remove_liquidity(provider_, all);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(pool_.lp_balance(provider_), 0u);
    EXPECT_EQ(pool_.state().lp_supply, MINIMUM_LIQUIDITY);
    EXPECT_GT(pool_.state().reserve_a, 0u);
}

// ============================================================================
// Swaps
// ============================================================================

TEST_F(AmmPoolTest, SwapUpdatesReservesAndFees) {
    SwapQuote quote = pool_.swap(SwapDirection::A_TO_B, SOL, 0);
    ASSERT_TRUE(quote.ok());
    EXPECT_EQ(quote.amount_out, 996'006'981u);
    EXPECT_EQ(pool_.state().reserve_a, 1001 * SOL);
    EXPECT_EQ(pool_.cumulative_fee_a(), 3'000'000u);
    EXPECT_EQ(pool_.cumulative_fee_b(), 0u);
    EXPECT_EQ(pool_.swap_count(), 1u);
}

TEST_F(AmmPoolTest, SwapBelowMinimumIsRejected) {
    PoolState before = pool_.state();
    SwapQuote quote = pool_.swap(SwapDirection::A_TO_B, SOL, SOL);
    EXPECT_EQ(quote.error, ErrorCode::SLIPPAGE_TOO_HIGH);
    EXPECT_EQ(pool_.state(), before);
    EXPECT_EQ(pool_.swap_count(), 0u);
}

TEST_F(AmmPoolTest, QuoteMatchesExecution) {
    SwapQuote quote = pool_.quote_swap(SwapDirection::B_TO_A, 7 * SOL);
    SwapQuote executed = pool_.swap(SwapDirection::B_TO_A, 7 * SOL, quote.amount_out);
    ASSERT_TRUE(executed.ok());
    EXPECT_EQ(executed.amount_out, quote.amount_out);
}

TEST_F(AmmPoolTest, SwapByMint) {
    SwapQuote a_in = pool_.swap_by_mint(config_.mint_a, SOL, 0);
    ASSERT_TRUE(a_in.ok());
    EXPECT_EQ(pool_.state().reserve_a, 1001 * SOL);

    SwapQuote b_in = pool_.swap_by_mint(config_.mint_b, SOL, 0);
    ASSERT_TRUE(b_in.ok());
    EXPECT_EQ(pool_.cumulative_fee_b(), 3'000'000u);

    SwapQuote unknown = pool_.swap_by_mint(Identity::from_label("mint:other"), SOL, 0);
    EXPECT_EQ(unknown.error, ErrorCode::INVALID_MINT);
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(AmmPoolTest, PauseBlocksTrading) {
    EXPECT_EQ(pool_.set_paused(stranger_, true), ErrorCode::UNAUTHORIZED);
    EXPECT_FALSE(pool_.is_paused());

    ASSERT_EQ(pool_.set_paused(config_.authority, true), ErrorCode::OK);
    EXPECT_EQ(pool_.swap(SwapDirection::A_TO_B, SOL, 0).error, ErrorCode::POOL_PAUSED);
    EXPECT_EQ(pool_.add_liquidity(provider_, SOL, SOL).error, ErrorCode::POOL_PAUSED);
    EXPECT_EQ(pool_.remove_liquidity(provider_, SOL).error, ErrorCode::POOL_PAUSED);

    ASSERT_EQ(pool_.set_paused(config_.authority, false), ErrorCode::OK);
    EXPECT_TRUE(pool_.swap(SwapDirection::A_TO_B, SOL, 0).ok());
}

TEST_F(AmmPoolTest, UpdateFee) {
    EXPECT_EQ(pool_.update_fee(stranger_, 10), ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(pool_.update_fee(config_.authority, MAX_ADMIN_FEE_BPS + 1), ErrorCode::INVALID_FEE);
    EXPECT_EQ(pool_.state().fee_bps, DEFAULT_FEE_BPS);

    ASSERT_EQ(pool_.update_fee(config_.authority, 0), ErrorCode::OK);
    SwapQuote quote = pool_.swap(SwapDirection::A_TO_B, SOL, 0);
    ASSERT_TRUE(quote.ok());
    EXPECT_EQ(quote.fee, 0u);
}

// ============================================================================
// Execution Target
// ============================================================================

TEST_F(AmmPoolTest, StakeIntentSwapsAToB) {
    ExecutionTarget& target = pool_;
    EXPECT_EQ(target.venue_name(), "amm");

    ExecutionQuote quote = target.quote(IntentKind::STAKE, SOL);
    ASSERT_TRUE(quote.ok());

    ExecutionQuote executed = target.execute(IntentKind::STAKE, SOL);
    ASSERT_TRUE(executed.ok());
    EXPECT_EQ(executed.amount_out, quote.amount_out);
    EXPECT_EQ(pool_.state().reserve_a, 1001 * SOL);
}

TEST_F(AmmPoolTest, UnstakeIntentSwapsBToA) {
    ExecutionQuote executed = pool_.execute(IntentKind::UNSTAKE, SOL);
    ASSERT_TRUE(executed.ok());
    EXPECT_EQ(pool_.state().reserve_b, 1001 * SOL);
}

TEST_F(AmmPoolTest, CopiesAreIndependent) {
    AmmPool clone = pool_;
    ASSERT_TRUE(clone.swap(SwapDirection::A_TO_B, 10 * SOL, 0).ok());
    EXPECT_EQ(pool_.state().reserve_a, 1000 * SOL);
    EXPECT_EQ(clone.state().reserve_a, 1010 * SOL);
}

}  // namespace
}  // namespace slp
