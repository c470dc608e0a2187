#include "transaction.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace slp {

Transaction Transaction::direct_swap(const Identity& signer,
                                     lamports_t amount_in,
                                     lamports_t min_out,
                                     SwapDirection direction) {
    Transaction tx;
    tx.kind = TransactionKind::DIRECT_SWAP;
    tx.signer = signer;
    tx.payload.resize(DIRECT_SWAP_SIZE);
    encode_u64(tx.payload.data(), amount_in);
    encode_u64(tx.payload.data() + 8, min_out);
    tx.payload[16] = static_cast<std::uint8_t>(direction);
    return tx;
}

Transaction Transaction::commit(const Identity& signer,
                                const hash_t& hash,
                                lamports_t amount,
                                IntentKind intent_kind) {
    Transaction tx;
    tx.kind = TransactionKind::COMMIT;
    tx.signer = signer;
    tx.payload.resize(COMMIT_SIZE);
    std::copy(hash.begin(), hash.end(), tx.payload.begin());
    encode_u64(tx.payload.data() + HASH_SIZE, amount);
    tx.payload[HASH_SIZE + 8] = static_cast<std::uint8_t>(intent_kind);
    return tx;
}

Transaction Transaction::reveal(const Identity& signer,
                                const SwapDetails& details,
                                IntentKind intent_kind) {
    Transaction tx;
    tx.kind = TransactionKind::REVEAL;
    tx.signer = signer;
    tx.payload = details.serialize();
    tx.payload.push_back(static_cast<std::uint8_t>(intent_kind));
    return tx;
}

Transaction Transaction::cancel(const Identity& signer, const Identity& owner) {
    Transaction tx;
    tx.kind = TransactionKind::CANCEL;
    tx.signer = signer;
    tx.payload.assign(owner.bytes.begin(), owner.bytes.end());
    return tx;
}

std::string Transaction::signature() const {
    auto kind_byte = static_cast<std::uint8_t>(kind);
    return bytes_to_hex(sha256_multi(std::span<const std::uint8_t>(&kind_byte, 1),
                                     std::span<const std::uint8_t>(signer.bytes),
                                     std::span<const std::uint8_t>(payload)));
}

}  // namespace slp
