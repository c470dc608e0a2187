#include "pool.hh"
#include "core/logging.hh"

namespace slp {

AmmPool::AmmPool(MarketConfig config)
    : config_(std::move(config)) {
    state_.fee_bps = config_.fee_bps;
}

// ============================================================================
// Liquidity
// ============================================================================

DepositResult AmmPool::add_liquidity(const Identity& provider, lamports_t amount_a, lamports_t amount_b) {
    if (paused_) {
        return DepositResult{0, ErrorCode::POOL_PAUSED};
    }

    bool initial = state_.lp_supply == 0;
    DepositResult result = apply_deposit(state_, amount_a, amount_b);
    if (!result.ok()) {
        SLP_LOG_DEBUG(log::amm) << "Deposit rejected: " << error_code_string(result.error);
        return result;
    }

    lp_balances_[provider] += result.lp_minted;

    SLP_LOG_DEBUG(log::amm) << (initial ? "Initial" : "Proportional") << " deposit by "
                            << provider.short_hex() << ": minted " << result.lp_minted
                            << " LP, reserves " << state_.reserve_a << "/" << state_.reserve_b;
    return result;
}

WithdrawResult AmmPool::remove_liquidity(const Identity& provider, std::uint64_t lp_amount) {
    if (paused_) {
        return WithdrawResult{0, 0, ErrorCode::POOL_PAUSED};
    }

    auto it = lp_balances_.find(provider);
    if (it == lp_balances_.end() || it->second < lp_amount) {
        return WithdrawResult{0, 0, ErrorCode::INSUFFICIENT_BALANCE};
    }

    WithdrawResult result = apply_withdraw(state_, lp_amount);
    if (!result.ok()) {
        return result;
    }

    it->second -= lp_amount;
    if (it->second == 0) {
        lp_balances_.erase(it);
    }
    return result;
}

std::uint64_t AmmPool::lp_balance(const Identity& provider) const {
    auto it = lp_balances_.find(provider);
    return it == lp_balances_.end() ? 0 : it->second;
}

// ============================================================================
// Swaps
// ============================================================================

SwapQuote AmmPool::quote_swap(SwapDirection dir, lamports_t amount_in) const {
    if (paused_) {
        SwapQuote quote;
        quote.error = ErrorCode::POOL_PAUSED;
        return quote;
    }
    return slp::quote_swap(state_, amount_in, dir);
}

SwapQuote AmmPool::swap(SwapDirection dir, lamports_t amount_in, lamports_t min_out) {
    SwapQuote quote = quote_swap(dir, amount_in);
    if (!quote.ok()) {
        return quote;
    }
    if (quote.amount_out < min_out) {
        SLP_LOG_DEBUG(log::amm) << "Swap output " << quote.amount_out << " below minimum " << min_out;
        quote.error = ErrorCode::SLIPPAGE_TOO_HIGH;
        return quote;
    }

    quote = apply_swap(state_, amount_in, dir);
    if (!quote.ok()) {
        return quote;
    }

    if (dir == SwapDirection::A_TO_B) {
        cumulative_fee_a_ += quote.fee;
    } else {
        cumulative_fee_b_ += quote.fee;
    }
    ++swap_count_;

    SLP_LOG_TRACE(log::amm) << "Swap " << swap_direction_string(dir) << " in=" << amount_in
                            << " out=" << quote.amount_out << " fee=" << quote.fee
                            << " impact=" << quote.price_impact_bps << "bps";
    return quote;
}

SwapQuote AmmPool::swap_by_mint(const Identity& mint_in, lamports_t amount_in, lamports_t min_out) {
    if (mint_in == config_.mint_a) {
        return swap(SwapDirection::A_TO_B, amount_in, min_out);
    }
    if (mint_in == config_.mint_b) {
        return swap(SwapDirection::B_TO_A, amount_in, min_out);
    }
    SwapQuote quote;
    quote.error = ErrorCode::INVALID_MINT;
    return quote;
}

// ============================================================================
// Administration
// ============================================================================

ErrorCode AmmPool::set_paused(const Identity& caller, bool paused) {
    if (caller != config_.authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    paused_ = paused;
    log::amm.info() << "Pool " << (paused ? "paused" : "resumed");
    return ErrorCode::OK;
}

ErrorCode AmmPool::update_fee(const Identity& caller, bps_t fee_bps) {
    if (caller != config_.authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    if (fee_bps > MAX_ADMIN_FEE_BPS) {
        return ErrorCode::INVALID_FEE;
    }
    log::amm.info() << "Fee updated " << state_.fee_bps << " -> " << fee_bps << " bps";
    state_.fee_bps = fee_bps;
    config_.fee_bps = fee_bps;
    return ErrorCode::OK;
}

// ============================================================================
// ExecutionTarget
// ============================================================================

ExecutionQuote AmmPool::quote(IntentKind kind, lamports_t amount_in) const {
    SwapQuote q = quote_swap(intent_direction(kind), amount_in);
    return ExecutionQuote{q.amount_out, q.fee, q.error};
}

ExecutionQuote AmmPool::execute(IntentKind kind, lamports_t amount_in) {
    // Minimum output is enforced by the caller before execution
    SwapQuote q = swap(intent_direction(kind), amount_in, 0);
    return ExecutionQuote{q.amount_out, q.fee, q.error};
}

}  // namespace slp
