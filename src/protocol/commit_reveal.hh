#pragma once

#include "core/errors.hh"
#include "core/execution.hh"
#include "protocol/clock.hh"
#include "protocol/commitment.hh"

namespace slp {

// ============================================================================
// Protocol Configuration
// ============================================================================

struct ProtocolConfig {
    static constexpr std::int64_t MIN_DELAY_SECONDS = 1;
    static constexpr bps_t MAX_SLIPPAGE_BPS = 1000;         // 10%
    static constexpr lamports_t MIN_AMOUNT = 1'000'000;     // 0.001 SOL

    std::int64_t min_delay_seconds = MIN_DELAY_SECONDS;
    bps_t max_slippage_bps = MAX_SLIPPAGE_BPS;
    lamports_t min_amount = MIN_AMOUNT;
    lamports_t commitment_rent = rent_exempt_minimum(Commitment::ACCOUNT_SPACE);
};

// ============================================================================
// Results
// ============================================================================

struct CommitmentHandle {
    Identity owner;
    hash_t hash{};
    unix_time_t created_at = 0;
    lamports_t rent_paid = 0;
};

struct CommitResult {
    bool success = false;
    CommitmentHandle handle;
    ErrorCode error = ErrorCode::OK;
};

struct ExecutionReceipt {
    bool success = false;
    IntentKind intent_kind = IntentKind::STAKE;
    lamports_t amount_in = 0;
    lamports_t amount_out = 0;
    lamports_t fee = 0;
    lamports_t rent_refunded = 0;
    unix_time_t executed_at = 0;
    std::int64_t waited_seconds = 0;
    ErrorCode error = ErrorCode::OK;
};

struct CancelResult {
    bool success = false;
    lamports_t rent_refunded = 0;
    ErrorCode error = ErrorCode::OK;
};

struct ProtocolStats {
    std::uint64_t commits = 0;
    std::uint64_t reveals = 0;
    std::uint64_t cancels = 0;
    std::uint64_t rejected = 0;
};

// ============================================================================
// Commit-Reveal Protocol
// ============================================================================
//
// NoCommitment --commit--> Committed --reveal_and_execute--> NoCommitment
//                                    --cancel------------> NoCommitment
//
// A reveal is all-or-nothing: any failure leaves both the commitment and
// the execution target exactly as they were.

class CommitRevealProtocol {
public:
    CommitRevealProtocol(ExecutionTarget& target,
                         const LedgerClock& clock,
                         ProtocolConfig config = ProtocolConfig{});

    CommitResult commit(const Identity& owner,
                        lamports_t amount,
                        IntentKind intent_kind,
                        const hash_t& hash);

    ExecutionReceipt reveal_and_execute(const Identity& owner, const SwapDetails& details);

    // Kind-checked variants; a commitment of the other kind reads as not found
    ExecutionReceipt reveal_and_stake(const Identity& owner, const SwapDetails& details);
    ExecutionReceipt reveal_and_unstake(const Identity& owner, const SwapDetails& details);

    // No delay applies. Only the owner may cancel.
    CancelResult cancel(const Identity& caller, const Identity& owner);

    [[nodiscard]] std::optional<Commitment> get_commitment(const Identity& owner) const;
    [[nodiscard]] const ExecutionTarget& target() const { return target_; }
    [[nodiscard]] const ProtocolConfig& config() const { return config_; }
    [[nodiscard]] const ProtocolStats& stats() const { return stats_; }
    [[nodiscard]] std::size_t pending_count() const { return store_.size(); }

private:
    ExecutionTarget& target_;
    const LedgerClock& clock_;
    ProtocolConfig config_;
    CommitmentStore store_;
    ProtocolStats stats_;

    ExecutionReceipt reject(ExecutionReceipt receipt, ErrorCode error);
    ExecutionReceipt reveal_checked(const Identity& owner,
                                    const SwapDetails& details,
                                    std::optional<IntentKind> required_kind);
};

// ============================================================================
// Client Helpers
// ============================================================================

struct PreparedIntent {
    SwapDetails details;
    hash_t hash{};
};

// Builds details with a fresh CSPRNG nonce and their commitment hash
[[nodiscard]] PreparedIntent prepare_intent(lamports_t amount_in, lamports_t min_out, bps_t slippage_bps);
[[nodiscard]] PreparedIntent prepare_intent(lamports_t amount_in, lamports_t min_out, bps_t slippage_bps,
                                            const nonce_t& nonce);

}  // namespace slp
