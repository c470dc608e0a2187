#pragma once

#include "core/execution.hh"
#include "core/types.hh"
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace slp {

// ============================================================================
// Swap Details - the hidden trade parameters bound by a commitment
// ============================================================================

struct SwapDetails {
    lamports_t amount_in = 0;
    lamports_t min_out = 0;
    bps_t slippage_bps = 0;     // 0..=10000
    nonce_t nonce{};

    // amount_in(u64 LE) || min_out(u64 LE) || slippage_bps(u16 LE) || nonce
    static constexpr std::size_t SERIALIZED_SIZE = 8 + 8 + 2 + NONCE_SIZE;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<SwapDetails> deserialize(std::span<const std::uint8_t> data);

    // SHA-256 over the canonical serialization
    [[nodiscard]] hash_t commitment_hash() const;

    bool operator==(const SwapDetails&) const = default;
};

// ============================================================================
// Commitment
// ============================================================================

// Account rent for a record of the given size (two years of rent at the base rate)
[[nodiscard]] constexpr lamports_t rent_exempt_minimum(std::size_t data_len) {
    return (128 + static_cast<lamports_t>(data_len)) * 3480 * 2;
}

struct Commitment {
    Identity owner;
    hash_t hash{};
    unix_time_t created_at = 0;
    lamports_t amount = 0;
    IntentKind intent_kind = IntentKind::STAKE;
    lamports_t rent_lamports = 0;

    // discriminator + owner + hash + created_at + amount + intent_kind + bump
    static constexpr std::size_t ACCOUNT_SPACE = 8 + IDENTITY_SIZE + HASH_SIZE + 8 + 8 + 1 + 1;
};

// ============================================================================
// Commitment Store - at most one live commitment per owner
// ============================================================================

class CommitmentStore {
public:
    enum class AddResult {
        ADDED,
        ALREADY_EXISTS,
    };
    AddResult add(const Commitment& commitment);

    [[nodiscard]] std::optional<Commitment> get(const Identity& owner) const;
    [[nodiscard]] bool contains(const Identity& owner) const;

    // Removes and returns the commitment
    std::optional<Commitment> close(const Identity& owner);

    [[nodiscard]] std::size_t size() const { return commitments_.size(); }
    [[nodiscard]] lamports_t total_escrowed_rent() const;

private:
    std::unordered_map<Identity, Commitment> commitments_;
};

}  // namespace slp
