#include "types.hh"
#include <algorithm>
#include <atomic>
#include <cstring>

namespace slp {

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

namespace {

std::optional<std::uint8_t> hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    // Skip optional 0x prefix
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto high = hex_nibble(hex[i]);
        auto low = hex_nibble(hex[i + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((*high << 4) | *low));
    }

    return result;
}

// ============================================================================
// Display Helpers
// ============================================================================

std::string format_sol(lamports_t lamports) {
    std::string frac = std::to_string(lamports % LAMPORTS_PER_SOL);
    frac.insert(0, 9 - frac.size(), '0');
    return std::to_string(lamports / LAMPORTS_PER_SOL) + "." + frac;
}

std::string format_signed_sol(std::int64_t lamports) {
    if (lamports < 0) {
        // Negate in unsigned space so INT64_MIN is representable
        auto magnitude = static_cast<lamports_t>(0) - static_cast<lamports_t>(lamports);
        return "-" + format_sol(magnitude);
    }
    return format_sol(static_cast<lamports_t>(lamports));
}

std::optional<lamports_t> parse_sol(std::string_view sol) {
    if (sol.empty()) {
        return std::nullopt;
    }

    auto dot = sol.find('.');
    std::string_view whole = sol.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos ? std::string_view{} : sol.substr(dot + 1);

    if ((whole.empty() && frac.empty()) || frac.size() > 9) {
        return std::nullopt;
    }

    u128 lamports = 0;
    for (char c : whole) {
        if (c < '0' || c > '9') return std::nullopt;
        lamports = lamports * 10 + static_cast<u128>(c - '0');
        if (lamports > UINT64_MAX) return std::nullopt;
    }
    lamports *= LAMPORTS_PER_SOL;

    u128 scale = LAMPORTS_PER_SOL;
    for (char c : frac) {
        if (c < '0' || c > '9') return std::nullopt;
        scale /= 10;
        lamports += static_cast<u128>(c - '0') * scale;
    }

    if (lamports > UINT64_MAX) {
        return std::nullopt;
    }
    return static_cast<lamports_t>(lamports);
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

// ============================================================================
// Identity Implementation
// ============================================================================

std::string Identity::to_hex() const {
    return "0x" + bytes_to_hex(bytes);
}

std::string Identity::short_hex() const {
    return bytes_to_hex(std::span<const std::uint8_t>(bytes.data(), 4));
}

std::optional<Identity> Identity::from_hex(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != IDENTITY_SIZE) {
        return std::nullopt;
    }
    Identity id;
    std::copy(bytes_opt->begin(), bytes_opt->end(), id.bytes.begin());
    return id;
}

}  // namespace slp
