#pragma once

#include "core/errors.hh"
#include "core/types.hh"

namespace slp {

// ============================================================================
// AMM Constants
// ============================================================================

inline constexpr bps_t DEFAULT_FEE_BPS = 30;        // 0.3%
inline constexpr bps_t MAX_ADMIN_FEE_BPS = 1000;    // fee updates capped at 10%
inline constexpr std::uint64_t MINIMUM_LIQUIDITY = 1000;  // LP units locked on first deposit

// ============================================================================
// Pool State
// ============================================================================

struct PoolState {
    lamports_t reserve_a = 0;
    lamports_t reserve_b = 0;
    bps_t fee_bps = DEFAULT_FEE_BPS;
    std::uint64_t lp_supply = 0;

    // Seeded pool whose LP supply matches an initial deposit of (a, b)
    [[nodiscard]] static PoolState seeded(lamports_t a, lamports_t b, bps_t fee_bps = DEFAULT_FEE_BPS);

    [[nodiscard]] lamports_t reserve_in(SwapDirection dir) const {
        return dir == SwapDirection::A_TO_B ? reserve_a : reserve_b;
    }
    [[nodiscard]] lamports_t reserve_out(SwapDirection dir) const {
        return dir == SwapDirection::A_TO_B ? reserve_b : reserve_a;
    }

    [[nodiscard]] u128 k() const { return static_cast<u128>(reserve_a) * reserve_b; }

    // Fixed-point prices scaled by PRICE_SCALE; 0 when the denominator side is empty
    [[nodiscard]] std::uint64_t price_a_in_b() const;
    [[nodiscard]] std::uint64_t price_b_in_a() const;

    bool operator==(const PoolState&) const = default;
};

// ============================================================================
// Swap Quotes
// ============================================================================

struct SwapQuote {
    lamports_t amount_out = 0;
    lamports_t fee = 0;
    std::uint32_t price_impact_bps = 0;
    ErrorCode error = ErrorCode::OK;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

// Constant-product output with the fee taken from the input side.
//   after_fee  = amount_in * (10000 - fee_bps) / 10000
//   amount_out = reserve_out * after_fee / (reserve_in + after_fee)
[[nodiscard]] SwapQuote swap_output(lamports_t amount_in,
                                    lamports_t reserve_in,
                                    lamports_t reserve_out,
                                    bps_t fee_bps);

[[nodiscard]] SwapQuote quote_swap(const PoolState& state, lamports_t amount_in, SwapDirection dir);

// Quote then move reserves; state is untouched when the quote fails
SwapQuote apply_swap(PoolState& state, lamports_t amount_in, SwapDirection dir);

// Lower bound a trader accepts for a quoted output
[[nodiscard]] lamports_t min_output_with_slippage(lamports_t quoted_out, bps_t slippage_bps);

// ============================================================================
// Liquidity
// ============================================================================

struct DepositResult {
    std::uint64_t lp_minted = 0;
    ErrorCode error = ErrorCode::OK;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

struct WithdrawResult {
    lamports_t amount_a = 0;
    lamports_t amount_b = 0;
    ErrorCode error = ErrorCode::OK;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

// First deposit mints isqrt(a*b) - MINIMUM_LIQUIDITY; later deposits mint
// min(a * supply / reserve_a, b * supply / reserve_b)
[[nodiscard]] DepositResult deposit_liquidity(const PoolState& state, lamports_t amount_a, lamports_t amount_b);
DepositResult apply_deposit(PoolState& state, lamports_t amount_a, lamports_t amount_b);

// Pro-rata share of each reserve; never empties a reserve
[[nodiscard]] WithdrawResult withdraw_liquidity(const PoolState& state, std::uint64_t lp_amount);
WithdrawResult apply_withdraw(PoolState& state, std::uint64_t lp_amount);

// ============================================================================
// Integer Math
// ============================================================================

[[nodiscard]] std::uint64_t integer_sqrt(u128 value);

}  // namespace slp
