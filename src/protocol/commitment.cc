#include "commitment.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace slp {

// ============================================================================
// SwapDetails Implementation
// ============================================================================

std::vector<std::uint8_t> SwapDetails::serialize() const {
    std::vector<std::uint8_t> data(SERIALIZED_SIZE);
    encode_u64(data.data(), amount_in);
    encode_u64(data.data() + 8, min_out);
    encode_u16(data.data() + 16, slippage_bps);
    std::copy(nonce.begin(), nonce.end(), data.begin() + 18);
    return data;
}

std::optional<SwapDetails> SwapDetails::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() != SERIALIZED_SIZE) {
        return std::nullopt;
    }

    SwapDetails details;
    details.amount_in = decode_u64(data.data());
    details.min_out = decode_u64(data.data() + 8);
    details.slippage_bps = decode_u16(data.data() + 16);
    if (details.slippage_bps > BPS_DENOMINATOR) {
        return std::nullopt;
    }
    std::copy(data.begin() + 18, data.end(), details.nonce.begin());
    return details;
}

hash_t SwapDetails::commitment_hash() const {
    return sha256(serialize());
}

// ============================================================================
// CommitmentStore Implementation
// ============================================================================

CommitmentStore::AddResult CommitmentStore::add(const Commitment& commitment) {
    auto [it, inserted] = commitments_.emplace(commitment.owner, commitment);
    return inserted ? AddResult::ADDED : AddResult::ALREADY_EXISTS;
}

std::optional<Commitment> CommitmentStore::get(const Identity& owner) const {
    auto it = commitments_.find(owner);
    if (it == commitments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CommitmentStore::contains(const Identity& owner) const {
    return commitments_.find(owner) != commitments_.end();
}

std::optional<Commitment> CommitmentStore::close(const Identity& owner) {
    auto it = commitments_.find(owner);
    if (it == commitments_.end()) {
        return std::nullopt;
    }
    Commitment closed = std::move(it->second);
    commitments_.erase(it);
    return closed;
}

lamports_t CommitmentStore::total_escrowed_rent() const {
    lamports_t total = 0;
    for (const auto& [owner, c] : commitments_) {
        total += c.rent_lamports;
    }
    return total;
}

}  // namespace slp
