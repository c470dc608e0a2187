#pragma once

#include "core/execution.hh"
#include "core/types.hh"
#include "protocol/commitment.hh"
#include <vector>

namespace slp {

// ============================================================================
// Transaction Kinds
// ============================================================================

enum class TransactionKind : std::uint8_t {
    DIRECT_SWAP = 0x01,
    COMMIT = 0x02,
    REVEAL = 0x03,
    CANCEL = 0x04,
};

[[nodiscard]] inline std::string_view transaction_kind_string(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::DIRECT_SWAP: return "direct_swap";
        case TransactionKind::COMMIT: return "commit";
        case TransactionKind::REVEAL: return "reveal";
        case TransactionKind::CANCEL: return "cancel";
    }
    return "unknown";
}

// ============================================================================
// Pending Transaction (as broadcast, before inclusion)
// ============================================================================
//
// Instruction payload layouts:
//   DIRECT_SWAP  amount_in(u64) || min_out(u64) || direction(u8)        17 bytes
//   COMMIT       hash[32] || amount(u64) || intent_kind(u8)             41 bytes
//   REVEAL       SwapDetails(50) || intent_kind(u8)                     51 bytes
//   CANCEL       owner[32]                                              32 bytes

struct Transaction {
    TransactionKind kind = TransactionKind::DIRECT_SWAP;
    Identity signer;
    std::vector<std::uint8_t> payload;

    static constexpr std::size_t DIRECT_SWAP_SIZE = 8 + 8 + 1;
    static constexpr std::size_t COMMIT_SIZE = HASH_SIZE + 8 + 1;
    static constexpr std::size_t REVEAL_SIZE = SwapDetails::SERIALIZED_SIZE + 1;
    static constexpr std::size_t CANCEL_SIZE = IDENTITY_SIZE;

    [[nodiscard]] static Transaction direct_swap(const Identity& signer,
                                                 lamports_t amount_in,
                                                 lamports_t min_out,
                                                 SwapDirection direction);
    [[nodiscard]] static Transaction commit(const Identity& signer,
                                            const hash_t& hash,
                                            lamports_t amount,
                                            IntentKind intent_kind);
    [[nodiscard]] static Transaction reveal(const Identity& signer,
                                            const SwapDetails& details,
                                            IntentKind intent_kind);
    [[nodiscard]] static Transaction cancel(const Identity& signer, const Identity& owner);

    // Simulated signature: hex of SHA-256(kind || signer || payload)
    [[nodiscard]] std::string signature() const;
};

}  // namespace slp
