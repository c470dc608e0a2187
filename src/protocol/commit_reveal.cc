#include "commit_reveal.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"

namespace slp {

CommitRevealProtocol::CommitRevealProtocol(ExecutionTarget& target,
                                           const LedgerClock& clock,
                                           ProtocolConfig config)
    : target_(target)
    , clock_(clock)
    , config_(config) {}

// ============================================================================
// Commit
// ============================================================================

CommitResult CommitRevealProtocol::commit(const Identity& owner,
                                          lamports_t amount,
                                          IntentKind intent_kind,
                                          const hash_t& hash) {
    CommitResult result;

    if (amount < config_.min_amount) {
        result.error = ErrorCode::AMOUNT_TOO_SMALL;
        ++stats_.rejected;
        return result;
    }

    Commitment commitment;
    commitment.owner = owner;
    commitment.hash = hash;
    commitment.created_at = clock_.now();
    commitment.amount = amount;
    commitment.intent_kind = intent_kind;
    commitment.rent_lamports = config_.commitment_rent;

    if (store_.add(commitment) == CommitmentStore::AddResult::ALREADY_EXISTS) {
        SLP_LOG_DEBUG(log::commit) << "Duplicate commitment from " << owner.short_hex();
        result.error = ErrorCode::COMMITMENT_ALREADY_EXISTS;
        ++stats_.rejected;
        return result;
    }

    ++stats_.commits;
    result.success = true;
    result.handle = CommitmentHandle{owner, hash, commitment.created_at, commitment.rent_lamports};

    SLP_LOG_DEBUG(log::commit) << "Commitment created: owner=" << owner.short_hex()
                               << " amount=" << amount
                               << " kind=" << intent_kind_string(intent_kind)
                               << " at=" << commitment.created_at;
    return result;
}

// ============================================================================
// Reveal
// ============================================================================

ExecutionReceipt CommitRevealProtocol::reject(ExecutionReceipt receipt, ErrorCode error) {
    receipt.success = false;
    receipt.error = error;
    ++stats_.rejected;
    SLP_LOG_DEBUG(log::reveal) << "Reveal rejected: " << error_code_string(error);
    return receipt;
}

ExecutionReceipt CommitRevealProtocol::reveal_and_execute(const Identity& owner, const SwapDetails& details) {
    return reveal_checked(owner, details, std::nullopt);
}

ExecutionReceipt CommitRevealProtocol::reveal_and_stake(const Identity& owner, const SwapDetails& details) {
    return reveal_checked(owner, details, IntentKind::STAKE);
}

ExecutionReceipt CommitRevealProtocol::reveal_and_unstake(const Identity& owner, const SwapDetails& details) {
    return reveal_checked(owner, details, IntentKind::UNSTAKE);
}

ExecutionReceipt CommitRevealProtocol::reveal_checked(const Identity& owner,
                                                      const SwapDetails& details,
                                                      std::optional<IntentKind> required_kind) {
    ExecutionReceipt receipt;
    receipt.amount_in = details.amount_in;

    auto commitment = store_.get(owner);
    if (!commitment || (required_kind && commitment->intent_kind != *required_kind)) {
        return reject(receipt, ErrorCode::COMMITMENT_NOT_FOUND);
    }
    receipt.intent_kind = commitment->intent_kind;

    unix_time_t now = clock_.now();
    receipt.executed_at = now;
    receipt.waited_seconds = now - commitment->created_at;

    if (now < commitment->created_at + config_.min_delay_seconds) {
        return reject(receipt, ErrorCode::DELAY_NOT_MET);
    }

    if (details.commitment_hash() != commitment->hash) {
        return reject(receipt, ErrorCode::HASH_MISMATCH);
    }

    if (details.slippage_bps > config_.max_slippage_bps) {
        return reject(receipt, ErrorCode::SLIPPAGE_TOO_HIGH);
    }

    ExecutionQuote quote = target_.quote(commitment->intent_kind, details.amount_in);
    if (!quote.ok()) {
        return reject(receipt, quote.error);
    }
    if (quote.amount_out < details.min_out) {
        return reject(receipt, ErrorCode::SLIPPAGE_TOO_HIGH);
    }

    ExecutionQuote executed = target_.execute(commitment->intent_kind, details.amount_in);
    if (!executed.ok()) {
        return reject(receipt, executed.error);
    }

    auto closed = store_.close(owner);
    ++stats_.reveals;

    receipt.success = true;
    receipt.amount_out = executed.amount_out;
    receipt.fee = executed.fee;
    receipt.rent_refunded = closed ? closed->rent_lamports : 0;

    SLP_LOG_DEBUG(log::reveal) << "Reveal complete on " << target_.venue_name()
                               << ": owner=" << owner.short_hex()
                               << " in=" << details.amount_in
                               << " out=" << executed.amount_out
                               << " waited=" << receipt.waited_seconds << "s";
    return receipt;
}

// ============================================================================
// Cancel
// ============================================================================

CancelResult CommitRevealProtocol::cancel(const Identity& caller, const Identity& owner) {
    CancelResult result;

    if (caller != owner) {
        result.error = ErrorCode::UNAUTHORIZED;
        ++stats_.rejected;
        return result;
    }

    auto closed = store_.close(owner);
    if (!closed) {
        result.error = ErrorCode::COMMITMENT_NOT_FOUND;
        ++stats_.rejected;
        return result;
    }

    ++stats_.cancels;
    result.success = true;
    result.rent_refunded = closed->rent_lamports;

    SLP_LOG_DEBUG(log::commit) << "Commitment cancelled: owner=" << owner.short_hex();
    return result;
}

std::optional<Commitment> CommitRevealProtocol::get_commitment(const Identity& owner) const {
    return store_.get(owner);
}

// ============================================================================
// Client Helpers
// ============================================================================

PreparedIntent prepare_intent(lamports_t amount_in, lamports_t min_out, bps_t slippage_bps) {
    return prepare_intent(amount_in, min_out, slippage_bps, random_nonce());
}

PreparedIntent prepare_intent(lamports_t amount_in, lamports_t min_out, bps_t slippage_bps,
                              const nonce_t& nonce) {
    PreparedIntent intent;
    intent.details.amount_in = amount_in;
    intent.details.min_out = min_out;
    intent.details.slippage_bps = slippage_bps;
    intent.details.nonce = nonce;
    intent.hash = intent.details.commitment_hash();
    return intent;
}

}  // namespace slp
