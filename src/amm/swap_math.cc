#include "swap_math.hh"
#include <algorithm>
#include <limits>

namespace slp {

namespace {

constexpr u128 U64_MAX = std::numeric_limits<std::uint64_t>::max();

}  // namespace

// ============================================================================
// Pool State
// ============================================================================

PoolState PoolState::seeded(lamports_t a, lamports_t b, bps_t fee_bps) {
    PoolState state;
    state.reserve_a = a;
    state.reserve_b = b;
    state.fee_bps = fee_bps;
    state.lp_supply = integer_sqrt(static_cast<u128>(a) * b);
    return state;
}

std::uint64_t PoolState::price_a_in_b() const {
    if (reserve_a == 0) return 0;
    u128 price = static_cast<u128>(reserve_b) * PRICE_SCALE / reserve_a;
    return price > U64_MAX ? std::numeric_limits<std::uint64_t>::max() : static_cast<std::uint64_t>(price);
}

std::uint64_t PoolState::price_b_in_a() const {
    if (reserve_b == 0) return 0;
    u128 price = static_cast<u128>(reserve_a) * PRICE_SCALE / reserve_b;
    return price > U64_MAX ? std::numeric_limits<std::uint64_t>::max() : static_cast<std::uint64_t>(price);
}

// ============================================================================
// Swap Quotes
// ============================================================================

SwapQuote swap_output(lamports_t amount_in,
                      lamports_t reserve_in,
                      lamports_t reserve_out,
                      bps_t fee_bps) {
    SwapQuote quote;

    if (fee_bps > BPS_DENOMINATOR) {
        quote.error = ErrorCode::INVALID_FEE;
        return quote;
    }
    if (reserve_in == 0 || reserve_out == 0) {
        quote.error = ErrorCode::ZERO_LIQUIDITY;
        return quote;
    }
    if (amount_in == 0) {
        quote.error = ErrorCode::INSUFFICIENT_INPUT;
        return quote;
    }
    // The input reserve must still fit once the trade settles
    if (static_cast<u128>(reserve_in) + amount_in > U64_MAX) {
        quote.error = ErrorCode::MATH_OVERFLOW;
        return quote;
    }

    u128 after_fee = static_cast<u128>(amount_in) * (BPS_DENOMINATOR - fee_bps) / BPS_DENOMINATOR;
    u128 numerator = static_cast<u128>(reserve_out) * after_fee;
    u128 denominator = static_cast<u128>(reserve_in) + after_fee;
    u128 amount_out = numerator / denominator;

    quote.amount_out = static_cast<lamports_t>(amount_out);
    quote.fee = amount_in - static_cast<lamports_t>(after_fee);

    // Impact relative to the spot-price output of the post-fee input
    u128 ideal = after_fee * reserve_out / reserve_in;
    if (ideal > 0) {
        quote.price_impact_bps = static_cast<std::uint32_t>((ideal - amount_out) * BPS_DENOMINATOR / ideal);
    }

    return quote;
}

SwapQuote quote_swap(const PoolState& state, lamports_t amount_in, SwapDirection dir) {
    return swap_output(amount_in, state.reserve_in(dir), state.reserve_out(dir), state.fee_bps);
}

SwapQuote apply_swap(PoolState& state, lamports_t amount_in, SwapDirection dir) {
    SwapQuote quote = quote_swap(state, amount_in, dir);
    if (!quote.ok()) {
        return quote;
    }

    if (dir == SwapDirection::A_TO_B) {
        state.reserve_a += amount_in;
        state.reserve_b -= quote.amount_out;
    } else {
        state.reserve_b += amount_in;
        state.reserve_a -= quote.amount_out;
    }
    return quote;
}

lamports_t min_output_with_slippage(lamports_t quoted_out, bps_t slippage_bps) {
    bps_t capped = static_cast<bps_t>(std::min<std::uint64_t>(slippage_bps, BPS_DENOMINATOR));
    u128 min_out = static_cast<u128>(quoted_out) * (BPS_DENOMINATOR - capped) / BPS_DENOMINATOR;
    return static_cast<lamports_t>(min_out);
}

// ============================================================================
// Liquidity
// ============================================================================

DepositResult deposit_liquidity(const PoolState& state, lamports_t amount_a, lamports_t amount_b) {
    DepositResult result;

    if (amount_a == 0 || amount_b == 0) {
        result.error = ErrorCode::INSUFFICIENT_INPUT;
        return result;
    }
    if (static_cast<u128>(state.reserve_a) + amount_a > U64_MAX ||
        static_cast<u128>(state.reserve_b) + amount_b > U64_MAX) {
        result.error = ErrorCode::MATH_OVERFLOW;
        return result;
    }

    if (state.lp_supply == 0) {
        std::uint64_t root = integer_sqrt(static_cast<u128>(amount_a) * amount_b);
        if (root <= MINIMUM_LIQUIDITY) {
            result.error = ErrorCode::MINIMUM_LIQUIDITY_NOT_MET;
            return result;
        }
        result.lp_minted = root - MINIMUM_LIQUIDITY;
        return result;
    }

    if (state.reserve_a == 0 || state.reserve_b == 0) {
        result.error = ErrorCode::ZERO_LIQUIDITY;
        return result;
    }

    u128 lp_from_a = static_cast<u128>(amount_a) * state.lp_supply / state.reserve_a;
    u128 lp_from_b = static_cast<u128>(amount_b) * state.lp_supply / state.reserve_b;
    u128 minted = std::min(lp_from_a, lp_from_b);

    if (minted == 0) {
        result.error = ErrorCode::INSUFFICIENT_INPUT;
        return result;
    }
    if (minted + state.lp_supply > U64_MAX) {
        result.error = ErrorCode::MATH_OVERFLOW;
        return result;
    }

    result.lp_minted = static_cast<std::uint64_t>(minted);
    return result;
}

DepositResult apply_deposit(PoolState& state, lamports_t amount_a, lamports_t amount_b) {
    DepositResult result = deposit_liquidity(state, amount_a, amount_b);
    if (!result.ok()) {
        return result;
    }

    // Locked minimum stays in supply with no owner
    std::uint64_t locked = state.lp_supply == 0 ? MINIMUM_LIQUIDITY : 0;
    state.reserve_a += amount_a;
    state.reserve_b += amount_b;
    state.lp_supply += result.lp_minted + locked;
    return result;
}

WithdrawResult withdraw_liquidity(const PoolState& state, std::uint64_t lp_amount) {
    WithdrawResult result;

    if (lp_amount == 0) {
        result.error = ErrorCode::INSUFFICIENT_INPUT;
        return result;
    }
    if (state.lp_supply == 0 || lp_amount > state.lp_supply) {
        result.error = ErrorCode::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    u128 out_a = static_cast<u128>(lp_amount) * state.reserve_a / state.lp_supply;
    u128 out_b = static_cast<u128>(lp_amount) * state.reserve_b / state.lp_supply;

    if (out_a == 0 || out_b == 0 || out_a >= state.reserve_a || out_b >= state.reserve_b) {
        result.error = ErrorCode::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    result.amount_a = static_cast<lamports_t>(out_a);
    result.amount_b = static_cast<lamports_t>(out_b);
    return result;
}

WithdrawResult apply_withdraw(PoolState& state, std::uint64_t lp_amount) {
    WithdrawResult result = withdraw_liquidity(state, lp_amount);
    if (!result.ok()) {
        return result;
    }

    state.reserve_a -= result.amount_a;
    state.reserve_b -= result.amount_b;
    state.lp_supply -= lp_amount;
    return result;
}

// ============================================================================
// Integer Math
// ============================================================================

std::uint64_t integer_sqrt(u128 value) {
    if (value < 2) {
        return static_cast<std::uint64_t>(value);
    }

    // Newton iteration from an upper bound; converges monotonically down
    u128 x = value;
    u128 y = x / 2 + (x & 1);
    while (y < x) {
        x = y;
        y = (x + value / x) / 2;
    }
    return static_cast<std::uint64_t>(x);
}

}  // namespace slp
