#include <gtest/gtest.h>
#include "mev/attacker.hh"

namespace slp {
namespace {

constexpr lamports_t SOL = LAMPORTS_PER_SOL;

class SandwichTest : public ::testing::Test {
protected:
    PendingSwap victim(lamports_t amount, lamports_t min_out = 0,
                       SwapDirection dir = SwapDirection::A_TO_B) const {
        return PendingSwap{Identity::from_label("victim"), amount, dir, min_out};
    }

    PoolState pool_ = PoolState::seeded(1000 * SOL, 1000 * SOL, 30);
};

// ============================================================================
// Single Candidate
// ============================================================================

TEST_F(SandwichTest, SimulateOnePercentFrontRun) {
    auto params = simulate_sandwich(victim(5 * SOL), pool_, 5 * SOL);
    ASSERT_TRUE(params.has_value());

    EXPECT_EQ(params->front_run_amount, 5 * SOL);
    EXPECT_EQ(params->front_run_output, 4'960'273'038u);
    EXPECT_EQ(params->victim_expected_output, 4'960'273'038u);
    EXPECT_EQ(params->victim_actual_output, 4'911'234'363u);
    EXPECT_EQ(params->back_run_output, 5'019'573'135u);
    EXPECT_EQ(params->expected_profit, 19'573'135);
    EXPECT_EQ(params->victim_expected_loss, 49'038'675u);
    EXPECT_TRUE(params->is_profitable);
}

TEST_F(SandwichTest, SimulationDoesNotTouchPool) {
    PoolState before = pool_;
    ASSERT_TRUE(simulate_sandwich(victim(5 * SOL), pool_, 100 * SOL).has_value());
    EXPECT_EQ(pool_, before);
}

TEST_F(SandwichTest, SimulateFailsOnInvalidLeg) {
    EXPECT_FALSE(simulate_sandwich(victim(5 * SOL), pool_, 0).has_value());
    EXPECT_FALSE(simulate_sandwich(victim(0), pool_, SOL).has_value());
    EXPECT_FALSE(simulate_sandwich(victim(5 * SOL), PoolState{}, SOL).has_value());
}

TEST_F(SandwichTest, VictimRevertMakesCandidateInfeasible) {
    lamports_t quoted = quote_swap(pool_, 5 * SOL, SwapDirection::A_TO_B).amount_out;
    EXPECT_FALSE(simulate_sandwich(victim(5 * SOL, quoted), pool_, 5 * SOL).has_value());
}

// ============================================================================
// Grid Search
// ============================================================================

TEST_F(SandwichTest, OptimalAttackOnUnprotectedTrade) {
    auto best = find_optimal_attack(victim(5 * SOL), pool_, 500 * SOL);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->front_run_amount, 245 * SOL);
    EXPECT_EQ(best->expected_profit, 586'455'709);
    EXPECT_EQ(best->victim_expected_loss, 1'755'129'555u);
    EXPECT_TRUE(best->is_profitable);
}

TEST_F(SandwichTest, CapitalBoundsFrontRun) {
    auto best = find_optimal_attack(victim(5 * SOL), pool_, 10 * SOL);
    ASSERT_TRUE(best.has_value());
    EXPECT_LE(best->front_run_amount, 10 * SOL);
    EXPECT_EQ(best->front_run_amount, 4'900'000'000u);
    EXPECT_EQ(best->expected_profit, 19'185'985);
}

TEST_F(SandwichTest, SmallTradesAreNotWorthAttacking) {
    EXPECT_FALSE(find_optimal_attack(victim(SOL), pool_, 500 * SOL).has_value());
    EXPECT_FALSE(find_optimal_attack(victim(SOL / 10), pool_, 500 * SOL).has_value());
}

TEST_F(SandwichTest, NoCapitalNoAttack) {
    EXPECT_FALSE(find_optimal_attack(victim(5 * SOL), pool_, 0).has_value());
    EXPECT_FALSE(find_optimal_attack(victim(5 * SOL), pool_, 10).has_value());
}

TEST_F(SandwichTest, SlippageToleranceShrinksAttack) {
    lamports_t quoted = quote_swap(pool_, 5 * SOL, SwapDirection::A_TO_B).amount_out;

    // 1% tolerance leaves room only for the smallest front-run
    auto loose = find_optimal_attack(victim(5 * SOL, min_output_with_slippage(quoted, 100)), pool_, 500 * SOL);
    ASSERT_TRUE(loose.has_value());
    EXPECT_EQ(loose->front_run_amount, 5 * SOL);
    EXPECT_EQ(loose->expected_profit, 19'573'135);

    // 0.5% tolerance leaves no feasible candidate
    auto tight = find_optimal_attack(victim(5 * SOL, min_output_with_slippage(quoted, 50)), pool_, 500 * SOL);
    EXPECT_FALSE(tight.has_value());
}

TEST_F(SandwichTest, ReverseDirectionIsSymmetric) {
    auto forward = find_optimal_attack(victim(5 * SOL), pool_, 500 * SOL);
    auto reverse = find_optimal_attack(victim(5 * SOL, 0, SwapDirection::B_TO_A), pool_, 500 * SOL);
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(reverse.has_value());
    EXPECT_EQ(forward->expected_profit, reverse->expected_profit);
}

// ============================================================================
// Attacker
// ============================================================================

class SandwichAttackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(pool_.add_liquidity(Identity::from_label("lp"), 1000 * SOL, 1000 * SOL).ok());
    }

    AmmPool pool_;
    SandwichAttacker attacker_{Identity::from_label("attacker"), 500 * SOL, 500 * SOL};
    PendingSwap victim_{Identity::from_label("victim"), 5 * SOL, SwapDirection::A_TO_B, 0};
};

TEST_F(SandwichAttackerTest, ExecutedSandwichMatchesPlan) {
    auto plan = attacker_.plan(victim_, pool_.state());
    ASSERT_TRUE(plan.has_value());

    SandwichOutcome outcome = attacker_.execute(pool_, victim_, *plan);
    ASSERT_TRUE(outcome.success) << outcome.reason;
    EXPECT_TRUE(outcome.victim_executed);
    EXPECT_EQ(outcome.realized_profit, plan->expected_profit);
    EXPECT_EQ(outcome.victim_loss, plan->victim_expected_loss);
    EXPECT_EQ(outcome.victim_received, plan->victim_actual_output);

    EXPECT_EQ(attacker_.balance_a(), 500 * SOL + 586'455'709);
    EXPECT_EQ(attacker_.balance_b(), 500 * SOL);
    EXPECT_EQ(attacker_.attacks_executed(), 1u);
    EXPECT_EQ(attacker_.total_profit(), 586'455'709);
    EXPECT_EQ(pool_.swap_count(), 3u);
}

TEST_F(SandwichAttackerTest, PlanUsesInputSideBalance) {
    SandwichAttacker poor_in_a{Identity::from_label("poor"), 0, 500 * SOL};
    EXPECT_FALSE(poor_in_a.plan(victim_, pool_.state()).has_value());

    PendingSwap reverse = victim_;
    reverse.direction = SwapDirection::B_TO_A;
    EXPECT_TRUE(poor_in_a.plan(reverse, pool_.state()).has_value());
    EXPECT_EQ(poor_in_a.balance(SwapDirection::B_TO_A), 500 * SOL);
}

TEST_F(SandwichAttackerTest, InsufficientBalanceAborts) {
    SandwichParams plan;
    plan.front_run_amount = 600 * SOL;
    PoolState before = pool_.state();

    SandwichOutcome outcome = attacker_.execute(pool_, victim_, plan);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.reason, "insufficient attacker balance");
    EXPECT_FALSE(outcome.victim_leg_ran);
    EXPECT_EQ(pool_.state(), before);
}

TEST_F(SandwichAttackerTest, AbortedSandwichLeavesVictimToSwapAlone) {
    SandwichParams plan;
    plan.front_run_amount = 600 * SOL;
    std::optional<SandwichOutcome> outcome = attacker_.execute(pool_, victim_, plan);
    ASSERT_FALSE(outcome->victim_leg_ran);

    SwapQuote expected = pool_.quote_swap(SwapDirection::A_TO_B, 5 * SOL);
    SwapQuote fill = settle_victim(pool_, victim_, outcome);
    ASSERT_TRUE(fill.ok());
    EXPECT_EQ(fill.amount_out, expected.amount_out);
    EXPECT_EQ(fill.amount_out, 4'960'273'038u);
    EXPECT_EQ(pool_.swap_count(), 1u);
}

TEST_F(SandwichAttackerTest, SettledVictimReusesSandwichLeg) {
    auto plan = attacker_.plan(victim_, pool_.state());
    ASSERT_TRUE(plan.has_value());
    std::optional<SandwichOutcome> outcome = attacker_.execute(pool_, victim_, *plan);
    ASSERT_TRUE(outcome->victim_leg_ran);

    SwapQuote fill = settle_victim(pool_, victim_, outcome);
    EXPECT_EQ(fill.amount_out, 3'205'143'483u);
    EXPECT_EQ(pool_.swap_count(), 3u);

    SwapQuote unattacked = settle_victim(pool_, victim_, std::nullopt);
    EXPECT_TRUE(unattacked.ok());
    EXPECT_EQ(pool_.swap_count(), 4u);
}

TEST_F(SandwichAttackerTest, RevertedVictimIsReported) {
    SandwichParams plan;
    plan.front_run_amount = 245 * SOL;
    PendingSwap guarded = victim_;
    guarded.min_out = pool_.quote_swap(SwapDirection::A_TO_B, 5 * SOL).amount_out;

    SandwichOutcome outcome = attacker_.execute(pool_, guarded, plan);
    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.victim_executed);
    EXPECT_EQ(outcome.victim_quote.error, ErrorCode::SLIPPAGE_TOO_HIGH);
    EXPECT_LT(outcome.realized_profit, 0);
    EXPECT_EQ(outcome.victim_loss, 0u);
    EXPECT_EQ(pool_.swap_count(), 2u);
}

}  // namespace
}  // namespace slp
