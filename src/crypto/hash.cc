#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <array>
#include <stdexcept>

namespace slp {

// ============================================================================
// Sha256Hasher Implementation
// ============================================================================

Sha256Hasher::Sha256Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error() << "Failed to create EVP_MD_CTX";
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        log::crypto.error() << "Failed to initialize SHA-256";
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void Sha256Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        log::crypto.error() << "SHA-256 update failed";
        throw std::runtime_error("SHA-256 update failed");
    }
}

hash_t Sha256Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), result.data(), &len) != 1) {
        log::crypto.error() << "SHA-256 finalize failed";
        throw std::runtime_error("SHA-256 finalize failed");
    }
    return result;
}

void Sha256Hasher::reset() {
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        log::crypto.error() << "SHA-256 reset failed";
        throw std::runtime_error("SHA-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha256(std::span<const std::uint8_t> data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        log::crypto.error() << "SHA-256 failed";
        throw std::runtime_error("SHA-256 failed");
    }
    return result;
}

// ============================================================================
// Nonces
// ============================================================================

nonce_t random_nonce() {
    nonce_t nonce;
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        log::crypto.error() << "RAND_bytes failed to produce a nonce";
        throw std::runtime_error("RAND_bytes failed");
    }
    return nonce;
}

HashDRBG::HashDRBG(const hash_t& seed) : state_(seed), counter_(0) {}

HashDRBG HashDRBG::from_u64(std::uint64_t seed) {
    std::array<std::uint8_t, 8> seed_bytes;
    encode_u64(seed_bytes.data(), seed);
    return HashDRBG(sha256(seed_bytes));
}

hash_t HashDRBG::next() {
    Sha256Hasher hasher;
    hasher.update(state_);

    std::array<std::uint8_t, 8> counter_bytes;
    encode_u64(counter_bytes.data(), counter_++);
    hasher.update(counter_bytes);

    state_ = hasher.finalize();
    return state_;
}

std::uint64_t HashDRBG::next_u64() {
    auto h = next();
    return decode_u64(h.data());
}

// ============================================================================
// Identity from label (declared in types.hh, implemented here)
// ============================================================================

Identity Identity::from_label(std::string_view label) {
    Identity id;
    id.bytes = sha256(label.data(), label.size());
    return id;
}

}  // namespace slp
