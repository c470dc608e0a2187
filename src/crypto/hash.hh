#pragma once

#include "core/types.hh"
#include <span>
#include <vector>

namespace slp {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha256(const void* data, std::size_t len);

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha256_multi(Args&&... args) {
    Sha256Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// Nonces
// ============================================================================

// 32 bytes from the OpenSSL CSPRNG; throws std::runtime_error if unavailable
[[nodiscard]] nonce_t random_nonce();

// Deterministic nonce stream for reproducible simulation runs.
// state_{n+1} = SHA-256(state_n || counter_le64)
class HashDRBG {
public:
    explicit HashDRBG(const hash_t& seed);

    [[nodiscard]] static HashDRBG from_u64(std::uint64_t seed);

    [[nodiscard]] hash_t next();
    [[nodiscard]] nonce_t next_nonce() { return next(); }
    [[nodiscard]] std::uint64_t next_u64();

private:
    hash_t state_;
    std::uint64_t counter_;
};

}  // namespace slp
