#include <gtest/gtest.h>
#include "amm/pool.hh"
#include "crypto/hash.hh"
#include "protocol/commit_reveal.hh"
#include "stake/stake_pool.hh"

namespace slp {
namespace {

constexpr lamports_t SOL = LAMPORTS_PER_SOL;
constexpr unix_time_t START = 1'700'000'000;

nonce_t fixed_nonce(std::uint8_t fill) {
    nonce_t nonce;
    nonce.fill(fill);
    return nonce;
}

class CommitRevealTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(pool_.add_liquidity(Identity::from_label("lp"), 1000 * SOL, 1000 * SOL).ok());
    }

    CommitResult commit(const PreparedIntent& intent, IntentKind kind = IntentKind::STAKE) {
        return protocol_.commit(trader_, intent.details.amount_in, kind, intent.hash);
    }

    AmmPool pool_;
    ManualLedgerClock clock_{START};
    CommitRevealProtocol protocol_{pool_, clock_};
    Identity trader_ = Identity::from_label("trader");
};

// ============================================================================
// Swap Details
// ============================================================================

TEST_F(CommitRevealTest, DetailsSerializationLayout) {
    SwapDetails details;
    details.amount_in = 0x0102030405060708ULL;
    details.min_out = 7;
    details.slippage_bps = 0x0164;
    details.nonce = fixed_nonce(0xAB);

    auto bytes = details.serialize();
    ASSERT_EQ(bytes.size(), SwapDetails::SERIALIZED_SIZE);
    EXPECT_EQ(bytes.size(), 50u);
    EXPECT_EQ(bytes[0], 0x08);
    EXPECT_EQ(bytes[8], 7);
    EXPECT_EQ(bytes[16], 0x64);
    EXPECT_EQ(bytes[17], 0x01);
    EXPECT_EQ(bytes[18], 0xAB);
    EXPECT_EQ(bytes[49], 0xAB);

    auto decoded = SwapDetails::deserialize(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, details);
}

TEST_F(CommitRevealTest, DetailsDeserializeRejectsMalformed) {
    SwapDetails details;
    auto bytes = details.serialize();
    bytes.pop_back();
    EXPECT_FALSE(SwapDetails::deserialize(bytes).has_value());

    details.slippage_bps = 10'001;
    EXPECT_FALSE(SwapDetails::deserialize(details.serialize()).has_value());
}

TEST_F(CommitRevealTest, GeneratedNoncesRoundTrip) {
    HashDRBG drbg = HashDRBG::from_u64(2024);
    for (int i = 0; i < 32; ++i) {
        nonce_t nonce = i % 2 == 0 ? random_nonce() : drbg.next_nonce();
        PreparedIntent intent = prepare_intent(drbg.next_u64(), drbg.next_u64(),
                                               static_cast<bps_t>(drbg.next_u64() % 10'001), nonce);

        auto decoded = SwapDetails::deserialize(intent.details.serialize());
        ASSERT_TRUE(decoded.has_value()) << i;
        EXPECT_EQ(*decoded, intent.details);
        EXPECT_EQ(decoded->commitment_hash(), intent.hash);
    }
}

TEST_F(CommitRevealTest, CommitmentHashBindsEveryField) {
    PreparedIntent base = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    EXPECT_EQ(base.hash, base.details.commitment_hash());
    EXPECT_EQ(base.hash, prepare_intent(SOL, 0, 100, fixed_nonce(1)).hash);

    EXPECT_NE(base.hash, prepare_intent(SOL + 1, 0, 100, fixed_nonce(1)).hash);
    EXPECT_NE(base.hash, prepare_intent(SOL, 1, 100, fixed_nonce(1)).hash);
    EXPECT_NE(base.hash, prepare_intent(SOL, 0, 101, fixed_nonce(1)).hash);
    EXPECT_NE(base.hash, prepare_intent(SOL, 0, 100, fixed_nonce(2)).hash);
}

TEST_F(CommitRevealTest, PreparedIntentsUseFreshNonces) {
    PreparedIntent a = prepare_intent(SOL, 0, 100);
    PreparedIntent b = prepare_intent(SOL, 0, 100);
    EXPECT_NE(a.details.nonce, b.details.nonce);
    EXPECT_NE(a.hash, b.hash);
}

// ============================================================================
// Commit
// ============================================================================

TEST_F(CommitRevealTest, CommitStoresRecord) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    CommitResult result = commit(intent);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.handle.created_at, START);
    EXPECT_EQ(result.handle.rent_paid, rent_exempt_minimum(Commitment::ACCOUNT_SPACE));
    EXPECT_EQ(result.handle.rent_paid, 1'517'280u);

    auto stored = protocol_.get_commitment(trader_);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->hash, intent.hash);
    EXPECT_EQ(stored->amount, SOL);
    EXPECT_EQ(stored->intent_kind, IntentKind::STAKE);
    EXPECT_EQ(protocol_.pending_count(), 1u);
}

TEST_F(CommitRevealTest, CommitBelowMinimumAmount) {
    PreparedIntent intent = prepare_intent(ProtocolConfig::MIN_AMOUNT - 1, 0, 100);
    CommitResult result = commit(intent);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorCode::AMOUNT_TOO_SMALL);
    EXPECT_EQ(protocol_.pending_count(), 0u);
}

TEST_F(CommitRevealTest, OneCommitmentPerOwner) {
    PreparedIntent first = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    PreparedIntent second = prepare_intent(2 * SOL, 0, 100, fixed_nonce(2));
    ASSERT_TRUE(commit(first).success);

    CommitResult duplicate = commit(second);
    EXPECT_EQ(duplicate.error, ErrorCode::COMMITMENT_ALREADY_EXISTS);
    EXPECT_EQ(protocol_.get_commitment(trader_)->hash, first.hash);

    Identity other = Identity::from_label("other");
    EXPECT_TRUE(protocol_.commit(other, 2 * SOL, IntentKind::STAKE, second.hash).success);
}

// ============================================================================
// Reveal
// ============================================================================

TEST_F(CommitRevealTest, RevealBeforeDelayFails) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);

    ExecutionReceipt receipt = protocol_.reveal_and_execute(trader_, intent.details);
    EXPECT_FALSE(receipt.success);
    EXPECT_EQ(receipt.error, ErrorCode::DELAY_NOT_MET);
    EXPECT_TRUE(protocol_.get_commitment(trader_).has_value());
    EXPECT_EQ(pool_.swap_count(), 0u);
}

TEST_F(CommitRevealTest, RevealAfterDelayExecutes) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);
    clock_.advance(ProtocolConfig::MIN_DELAY_SECONDS);

    ExecutionReceipt receipt = protocol_.reveal_and_execute(trader_, intent.details);
    ASSERT_TRUE(receipt.success);
    EXPECT_EQ(receipt.amount_out, 996'006'981u);
    EXPECT_EQ(receipt.fee, 3'000'000u);
    EXPECT_EQ(receipt.rent_refunded, 1'517'280u);
    EXPECT_EQ(receipt.waited_seconds, 1);
    EXPECT_EQ(receipt.executed_at, START + 1);
    EXPECT_EQ(receipt.intent_kind, IntentKind::STAKE);

    EXPECT_FALSE(protocol_.get_commitment(trader_).has_value());
    EXPECT_EQ(pool_.state().reserve_a, 1001 * SOL);
}

TEST_F(CommitRevealTest, RevealConsumesCommitment) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);
    clock_.advance(5);
    ASSERT_TRUE(protocol_.reveal_and_execute(trader_, intent.details).success);

    ExecutionReceipt replay = protocol_.reveal_and_execute(trader_, intent.details);
    EXPECT_EQ(replay.error, ErrorCode::COMMITMENT_NOT_FOUND);
    EXPECT_EQ(pool_.swap_count(), 1u);
}

TEST_F(CommitRevealTest, TamperedDetailsMismatch) {
    PreparedIntent intent = prepare_intent(SOL, 900'000'000, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);
    clock_.advance(1);

    SwapDetails tampered = intent.details;
    tampered.min_out = 0;
    PoolState before = pool_.state();

    ExecutionReceipt receipt = protocol_.reveal_and_execute(trader_, tampered);
    EXPECT_EQ(receipt.error, ErrorCode::HASH_MISMATCH);
    EXPECT_EQ(pool_.state(), before);
    EXPECT_TRUE(protocol_.get_commitment(trader_).has_value());

    // The honest reveal still works afterwards
    EXPECT_TRUE(protocol_.reveal_and_execute(trader_, intent.details).success);
}

TEST_F(CommitRevealTest, SlippageToleranceCapped) {
    PreparedIntent intent = prepare_intent(SOL, 0, ProtocolConfig::MAX_SLIPPAGE_BPS + 1, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);
    clock_.advance(1);

    ExecutionReceipt receipt = protocol_.reveal_and_execute(trader_, intent.details);
    EXPECT_EQ(receipt.error, ErrorCode::SLIPPAGE_TOO_HIGH);
    EXPECT_TRUE(protocol_.get_commitment(trader_).has_value());
}

TEST_F(CommitRevealTest, MinimumOutputEnforcedAtReveal) {
    lamports_t quoted = pool_.quote_swap(SwapDirection::A_TO_B, SOL).amount_out;
    PreparedIntent intent = prepare_intent(SOL, quoted, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);

    // Someone else moves the price while the commitment waits
    ASSERT_TRUE(pool_.swap(SwapDirection::A_TO_B, 50 * SOL, 0).ok());
    clock_.advance(1);
    PoolState before = pool_.state();

    ExecutionReceipt receipt = protocol_.reveal_and_execute(trader_, intent.details);
    EXPECT_EQ(receipt.error, ErrorCode::SLIPPAGE_TOO_HIGH);
    EXPECT_EQ(pool_.state(), before);
    EXPECT_TRUE(protocol_.get_commitment(trader_).has_value());
}

TEST_F(CommitRevealTest, VenueErrorPropagates) {
    PreparedIntent intent = prepare_intent(0, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(protocol_.commit(trader_, SOL, IntentKind::STAKE, intent.hash).success);
    clock_.advance(1);

    ExecutionReceipt receipt = protocol_.reveal_and_execute(trader_, intent.details);
    EXPECT_EQ(receipt.error, ErrorCode::INSUFFICIENT_INPUT);
    EXPECT_TRUE(protocol_.get_commitment(trader_).has_value());
}

TEST_F(CommitRevealTest, KindCheckedReveal) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent, IntentKind::UNSTAKE).success);
    clock_.advance(1);

    EXPECT_EQ(protocol_.reveal_and_stake(trader_, intent.details).error, ErrorCode::COMMITMENT_NOT_FOUND);

    ExecutionReceipt receipt = protocol_.reveal_and_unstake(trader_, intent.details);
    ASSERT_TRUE(receipt.success);
    EXPECT_EQ(receipt.intent_kind, IntentKind::UNSTAKE);
    EXPECT_EQ(pool_.state().reserve_b, 1001 * SOL);
}

TEST_F(CommitRevealTest, RevealWithoutCommitment) {
    SwapDetails details;
    details.amount_in = SOL;
    EXPECT_EQ(protocol_.reveal_and_execute(trader_, details).error, ErrorCode::COMMITMENT_NOT_FOUND);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_F(CommitRevealTest, OnlyOwnerCancels) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);

    CancelResult denied = protocol_.cancel(Identity::from_label("attacker"), trader_);
    EXPECT_EQ(denied.error, ErrorCode::UNAUTHORIZED);
    EXPECT_TRUE(protocol_.get_commitment(trader_).has_value());

    CancelResult result = protocol_.cancel(trader_, trader_);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.rent_refunded, 1'517'280u);
    EXPECT_FALSE(protocol_.get_commitment(trader_).has_value());

    EXPECT_EQ(protocol_.cancel(trader_, trader_).error, ErrorCode::COMMITMENT_NOT_FOUND);
}

TEST_F(CommitRevealTest, CancelAllowsFreshCommitment) {
    PreparedIntent first = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(first).success);
    ASSERT_TRUE(protocol_.cancel(trader_, trader_).success);

    PreparedIntent second = prepare_intent(2 * SOL, 0, 100, fixed_nonce(2));
    EXPECT_TRUE(commit(second).success);
}

TEST_F(CommitRevealTest, StatsTrackOutcomes) {
    PreparedIntent intent = prepare_intent(SOL, 0, 100, fixed_nonce(1));
    ASSERT_TRUE(commit(intent).success);
    EXPECT_FALSE(protocol_.reveal_and_execute(trader_, intent.details).success);
    clock_.advance(1);
    ASSERT_TRUE(protocol_.reveal_and_execute(trader_, intent.details).success);
    ASSERT_TRUE(commit(intent).success);
    ASSERT_TRUE(protocol_.cancel(trader_, trader_).success);

    const ProtocolStats& stats = protocol_.stats();
    EXPECT_EQ(stats.commits, 2u);
    EXPECT_EQ(stats.reveals, 1u);
    EXPECT_EQ(stats.cancels, 1u);
    EXPECT_EQ(stats.rejected, 1u);
}

// ============================================================================
// Other Venues
// ============================================================================

TEST(CommitRevealStakePoolTest, StakeThroughCommitReveal) {
    StakePool stake_pool;
    ManualLedgerClock clock(START);
    CommitRevealProtocol protocol(stake_pool, clock);
    Identity staker = Identity::from_label("staker");

    PreparedIntent intent = prepare_intent(10 * SOL, 10 * SOL, 0, fixed_nonce(9));
    ASSERT_TRUE(protocol.commit(staker, 10 * SOL, IntentKind::STAKE, intent.hash).success);
    clock.advance(2);

    ExecutionReceipt receipt = protocol.reveal_and_stake(staker, intent.details);
    ASSERT_TRUE(receipt.success);
    EXPECT_EQ(receipt.amount_out, 10 * SOL);
    EXPECT_EQ(receipt.waited_seconds, 2);
    EXPECT_EQ(stake_pool.state().slp_supply, 10 * SOL);
    EXPECT_EQ(protocol.target().venue_name(), "stake_pool");
}

TEST(LedgerClockTest, ManualClock) {
    ManualLedgerClock clock(10);
    EXPECT_EQ(clock.now(), 10);
    clock.advance(5);
    EXPECT_EQ(clock.now(), 15);
    clock.set(3);
    EXPECT_EQ(clock.now(), 3);
}

TEST(LedgerClockTest, SystemClockIsPlausible) {
    SystemLedgerClock clock;
    EXPECT_GT(clock.now(), START);
}

}  // namespace
}  // namespace slp
