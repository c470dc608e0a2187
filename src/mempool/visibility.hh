#pragma once

#include "mempool/transaction.hh"
#include <optional>
#include <string>

namespace slp {

// ============================================================================
// Observer View of a Pending Transaction
// ============================================================================

struct VisibleFields {
    TransactionKind kind = TransactionKind::DIRECT_SWAP;
    Identity signer;
    bool decoded = false;

    // Exposed by a direct swap (and by a reveal, too late to act on)
    std::optional<lamports_t> amount_in;
    std::optional<SwapDirection> direction;
    std::optional<lamports_t> min_out;

    // Exposed by a commit
    std::optional<hash_t> commitment_hash;
    std::optional<lamports_t> approximate_amount;
    std::optional<IntentKind> intent_kind;

    bool can_sandwich = false;
};

// A sandwichable trade as an attacker reconstructs it
struct PendingSwap {
    Identity trader;
    lamports_t amount_in = 0;
    SwapDirection direction = SwapDirection::A_TO_B;
    lamports_t min_out = 0;
};

// ============================================================================
// Mempool Visibility Model (stateless)
// ============================================================================

// Classify what any mempool observer learns from a broadcast transaction.
// Malformed payloads yield an opaque, non-sandwichable view.
[[nodiscard]] VisibleFields observe(const Transaction& tx);

// Only a decoded direct swap reconstructs into an attackable trade
[[nodiscard]] std::optional<PendingSwap> to_pending_swap(const VisibleFields& view);

// Human-readable account of why commit-reveal defeats sandwiching
[[nodiscard]] std::string explain_protection();

}  // namespace slp
