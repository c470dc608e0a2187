#include "visibility.hh"
#include "core/logging.hh"
#include <algorithm>
#include <sstream>

namespace slp {

namespace {

std::optional<SwapDirection> decode_direction(std::uint8_t byte) {
    if (byte > static_cast<std::uint8_t>(SwapDirection::B_TO_A)) return std::nullopt;
    return static_cast<SwapDirection>(byte);
}

std::optional<IntentKind> decode_intent_kind(std::uint8_t byte) {
    if (byte > static_cast<std::uint8_t>(IntentKind::UNSTAKE)) return std::nullopt;
    return static_cast<IntentKind>(byte);
}

void observe_direct_swap(const Transaction& tx, VisibleFields& view) {
    if (tx.payload.size() != Transaction::DIRECT_SWAP_SIZE) return;
    auto direction = decode_direction(tx.payload[16]);
    if (!direction) return;

    view.amount_in = decode_u64(tx.payload.data());
    view.min_out = decode_u64(tx.payload.data() + 8);
    view.direction = direction;
    view.decoded = true;
    // Exact size, direction and tolerance are public before inclusion
    view.can_sandwich = true;
}

void observe_commit(const Transaction& tx, VisibleFields& view) {
    if (tx.payload.size() != Transaction::COMMIT_SIZE) return;
    auto kind = decode_intent_kind(tx.payload[HASH_SIZE + 8]);
    if (!kind) return;

    hash_t hash;
    std::copy(tx.payload.begin(), tx.payload.begin() + HASH_SIZE, hash.begin());
    view.commitment_hash = hash;
    view.approximate_amount = decode_u64(tx.payload.data() + HASH_SIZE);
    view.intent_kind = kind;
    view.decoded = true;
}

void observe_reveal(const Transaction& tx, VisibleFields& view) {
    if (tx.payload.size() != Transaction::REVEAL_SIZE) return;
    auto details = SwapDetails::deserialize(
        std::span<const std::uint8_t>(tx.payload.data(), SwapDetails::SERIALIZED_SIZE));
    auto kind = decode_intent_kind(tx.payload.back());
    if (!details || !kind) return;

    // Parameters become public, but execution happens inside this same
    // transaction so there is no slot to insert a front-run into
    view.amount_in = details->amount_in;
    view.min_out = details->min_out;
    view.intent_kind = kind;
    view.direction = intent_direction(*kind);
    view.decoded = true;
}

void observe_cancel(const Transaction& tx, VisibleFields& view) {
    if (tx.payload.size() != Transaction::CANCEL_SIZE) return;
    view.decoded = true;
}

}  // namespace

VisibleFields observe(const Transaction& tx) {
    VisibleFields view;
    view.kind = tx.kind;
    view.signer = tx.signer;

    switch (tx.kind) {
        case TransactionKind::DIRECT_SWAP: observe_direct_swap(tx, view); break;
        case TransactionKind::COMMIT: observe_commit(tx, view); break;
        case TransactionKind::REVEAL: observe_reveal(tx, view); break;
        case TransactionKind::CANCEL: observe_cancel(tx, view); break;
    }

    if (!view.decoded) {
        SLP_LOG_DEBUG(log::mempool) << "Undecodable " << transaction_kind_string(tx.kind)
                                    << " payload (" << tx.payload.size() << " bytes) from "
                                    << tx.signer.short_hex();
    }

    SLP_LOG_TRACE(log::mempool) << "Observed " << transaction_kind_string(tx.kind)
                                << " sandwichable=" << view.can_sandwich;
    return view;
}

std::optional<PendingSwap> to_pending_swap(const VisibleFields& view) {
    if (!view.can_sandwich || view.kind != TransactionKind::DIRECT_SWAP ||
        !view.amount_in || !view.direction) {
        return std::nullopt;
    }
    PendingSwap swap;
    swap.trader = view.signer;
    swap.amount_in = *view.amount_in;
    swap.direction = *view.direction;
    swap.min_out = view.min_out.value_or(0);
    return swap;
}

std::string explain_protection() {
    std::ostringstream out;
    out << "How commit-reveal defeats sandwich attacks\n"
        << "==========================================\n\n"
        << "Direct swap (vulnerable)\n"
        << "  The pending transaction carries amount_in, direction and min_out in\n"
        << "  plain view. An attacker who sees it can buy ahead of it (front-run),\n"
        << "  let the victim execute at the worse price, then sell back (back-run)\n"
        << "  and keep the difference.\n\n"
        << "Commit (opaque)\n"
        << "  The commit transaction carries only SHA-256(amount_in || min_out ||\n"
        << "  slippage_bps || nonce). The 32-byte random nonce makes the hash\n"
        << "  impossible to invert by guessing amounts, so the observer cannot size\n"
        << "  a front-run or even tell which way the price will move.\n\n"
        << "Reveal (atomic)\n"
        << "  After the minimum delay the owner reveals the details. The protocol\n"
        << "  checks the hash, the slippage cap and min_out, then executes the trade\n"
        << "  in the same transaction. The parameters are public only once they are\n"
        << "  already being executed, so there is no window to place a front-run.\n\n"
        << "Result\n"
        << "  Protected trades settle at the undisturbed pool price. The value a\n"
        << "  sandwich would have extracted stays with the trader.\n";
    return out.str();
}

}  // namespace slp
