#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <compare>

namespace slp {

// ============================================================================
// Unit Constants
// ============================================================================

inline constexpr std::uint64_t LAMPORTS_PER_SOL = 1'000'000'000;

// Basis point denominator (100% = 10000 bps)
inline constexpr std::uint64_t BPS_DENOMINATOR = 10'000;

// Fixed-point scale for prices and exchange rates
inline constexpr std::uint64_t PRICE_SCALE = 1'000'000'000;

// SHA-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

inline constexpr std::size_t IDENTITY_SIZE = 32;
inline constexpr std::size_t NONCE_SIZE = 32;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using nonce_t = std::array<std::uint8_t, NONCE_SIZE>;
using lamports_t = std::uint64_t;
using unix_time_t = std::int64_t;
using bps_t = std::uint16_t;
using u128 = unsigned __int128;

// ============================================================================
// Identity (owner, trader or mint key)
// ============================================================================

struct Identity {
    std::array<std::uint8_t, IDENTITY_SIZE> bytes{};

    // Deterministic identity derived from a human-readable label
    [[nodiscard]] static Identity from_label(std::string_view label);
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] std::string short_hex() const;
    [[nodiscard]] static std::optional<Identity> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Identity&) const = default;
};

// ============================================================================
// Swap Direction
// ============================================================================

enum class SwapDirection : std::uint8_t {
    A_TO_B = 0,
    B_TO_A = 1,
};

[[nodiscard]] inline std::string_view swap_direction_string(SwapDirection dir) {
    switch (dir) {
        case SwapDirection::A_TO_B: return "a_to_b";
        case SwapDirection::B_TO_A: return "b_to_a";
    }
    return "unknown";
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
    }
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           static_cast<std::uint16_t>(static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// ============================================================================
// Display Helpers
// ============================================================================

// 1500000000 -> "1.500000000"
[[nodiscard]] std::string format_sol(lamports_t lamports);
[[nodiscard]] std::string format_signed_sol(std::int64_t lamports);

// Whole or fractional SOL amount to lamports; nullopt on malformed input
[[nodiscard]] std::optional<lamports_t> parse_sol(std::string_view sol);

// ============================================================================
// Zero Memory (for nonces)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace slp

// ============================================================================
// Hash specialization (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<slp::hash_t> {
    std::size_t operator()(const slp::hash_t& h) const noexcept {
        // First 8 bytes of a cryptographic digest
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<slp::Identity> {
    std::size_t operator()(const slp::Identity& id) const noexcept {
        return std::hash<slp::hash_t>{}(id.bytes);
    }
};

}  // namespace std
