#pragma once

#include <cstdint>
#include <string_view>

namespace slp {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : std::uint8_t {
    OK = 0x00,

    // Protocol violations (returned to the caller, never retried)
    COMMITMENT_ALREADY_EXISTS = 0x01,
    COMMITMENT_NOT_FOUND = 0x02,
    DELAY_NOT_MET = 0x03,
    HASH_MISMATCH = 0x04,
    SLIPPAGE_TOO_HIGH = 0x05,
    AMOUNT_TOO_SMALL = 0x06,
    UNAUTHORIZED = 0x07,
    INVALID_MINT = 0x08,

    // Arithmetic and liquidity faults (abort before any mutation)
    MATH_OVERFLOW = 0x10,
    INSUFFICIENT_LIQUIDITY = 0x11,
    ZERO_LIQUIDITY = 0x12,
    INVALID_FEE = 0x13,
    INSUFFICIENT_INPUT = 0x14,
    MINIMUM_LIQUIDITY_NOT_MET = 0x15,

    // Venue state
    POOL_PAUSED = 0x20,
    BELOW_MINIMUM_STAKE = 0x21,
    INSUFFICIENT_RESERVE = 0x22,
    INSUFFICIENT_BALANCE = 0x23,
};

[[nodiscard]] inline std::string_view error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::COMMITMENT_ALREADY_EXISTS: return "commitment_already_exists";
        case ErrorCode::COMMITMENT_NOT_FOUND: return "commitment_not_found";
        case ErrorCode::DELAY_NOT_MET: return "delay_not_met";
        case ErrorCode::HASH_MISMATCH: return "hash_mismatch";
        case ErrorCode::SLIPPAGE_TOO_HIGH: return "slippage_too_high";
        case ErrorCode::AMOUNT_TOO_SMALL: return "amount_too_small";
        case ErrorCode::UNAUTHORIZED: return "unauthorized";
        case ErrorCode::INVALID_MINT: return "invalid_mint";
        case ErrorCode::MATH_OVERFLOW: return "math_overflow";
        case ErrorCode::INSUFFICIENT_LIQUIDITY: return "insufficient_liquidity";
        case ErrorCode::ZERO_LIQUIDITY: return "zero_liquidity";
        case ErrorCode::INVALID_FEE: return "invalid_fee";
        case ErrorCode::INSUFFICIENT_INPUT: return "insufficient_input";
        case ErrorCode::MINIMUM_LIQUIDITY_NOT_MET: return "minimum_liquidity_not_met";
        case ErrorCode::POOL_PAUSED: return "pool_paused";
        case ErrorCode::BELOW_MINIMUM_STAKE: return "below_minimum_stake";
        case ErrorCode::INSUFFICIENT_RESERVE: return "insufficient_reserve";
        case ErrorCode::INSUFFICIENT_BALANCE: return "insufficient_balance";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_protocol_violation(ErrorCode code) {
    auto v = static_cast<std::uint8_t>(code);
    return v >= 0x01 && v < 0x10;
}

[[nodiscard]] inline bool is_arithmetic_fault(ErrorCode code) {
    auto v = static_cast<std::uint8_t>(code);
    return v >= 0x10 && v < 0x20;
}

}  // namespace slp
