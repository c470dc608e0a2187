#include "stake_pool.hh"
#include "core/logging.hh"
#include <limits>

namespace slp {

namespace {

constexpr u128 U64_MAX = std::numeric_limits<std::uint64_t>::max();

}  // namespace

std::uint64_t StakePoolState::exchange_rate() const {
    if (slp_supply == 0) {
        return PRICE_SCALE;
    }
    u128 rate = total_sol() * PRICE_SCALE / slp_supply;
    return rate > U64_MAX ? std::numeric_limits<std::uint64_t>::max() : static_cast<std::uint64_t>(rate);
}

StakePool::StakePool(StakePoolConfig config)
    : config_(std::move(config)) {}

// ============================================================================
// Quotes
// ============================================================================

StakeResult StakePool::quote_deposit(lamports_t sol_amount) const {
    StakeResult result;
    result.amount_in = sol_amount;

    if (paused_) {
        result.error = ErrorCode::POOL_PAUSED;
        return result;
    }
    if (sol_amount < config_.min_deposit) {
        result.error = ErrorCode::BELOW_MINIMUM_STAKE;
        return result;
    }

    u128 minted = sol_amount;
    if (state_.slp_supply > 0 && state_.total_sol() == 0) {
        result.error = ErrorCode::ZERO_LIQUIDITY;
        return result;
    }
    if (state_.slp_supply > 0) {
        minted = static_cast<u128>(sol_amount) * state_.slp_supply / state_.total_sol();
    }
    u128 new_total = state_.total_sol() + sol_amount;
    if (minted + state_.slp_supply > U64_MAX || new_total > U64_MAX) {
        result.error = ErrorCode::MATH_OVERFLOW;
        return result;
    }

    result.amount_out = static_cast<lamports_t>(minted);
    result.to_reserve = static_cast<lamports_t>(
        static_cast<u128>(sol_amount) * config_.reserve_ratio_bps / BPS_DENOMINATOR);
    return result;
}

StakeResult StakePool::quote_withdraw(std::uint64_t slp_amount) const {
    StakeResult result;
    result.amount_in = slp_amount;

    if (paused_) {
        result.error = ErrorCode::POOL_PAUSED;
        return result;
    }
    if (slp_amount == 0) {
        result.error = ErrorCode::INSUFFICIENT_INPUT;
        return result;
    }
    if (slp_amount > state_.slp_supply) {
        result.error = ErrorCode::INSUFFICIENT_BALANCE;
        return result;
    }

    u128 sol_out = static_cast<u128>(slp_amount) * state_.total_sol() / state_.slp_supply;
    if (sol_out > state_.reserve_lamports) {
        result.error = ErrorCode::INSUFFICIENT_RESERVE;
        return result;
    }

    result.amount_out = static_cast<lamports_t>(sol_out);
    return result;
}

// ============================================================================
// Mutations
// ============================================================================

StakeResult StakePool::deposit(lamports_t sol_amount) {
    StakeResult result = quote_deposit(sol_amount);
    if (!result.ok()) {
        return result;
    }

    state_.reserve_lamports += result.to_reserve;
    state_.total_staked += sol_amount - result.to_reserve;
    state_.slp_supply += result.amount_out;

    SLP_LOG_DEBUG(log::stake) << "Deposit " << format_sol(sol_amount) << " SOL -> "
                              << result.amount_out << " slpSOL, rate " << state_.exchange_rate();
    return result;
}

StakeResult StakePool::withdraw(std::uint64_t slp_amount) {
    StakeResult result = quote_withdraw(slp_amount);
    if (!result.ok()) {
        SLP_LOG_DEBUG(log::stake) << "Withdraw rejected: " << error_code_string(result.error);
        return result;
    }

    state_.reserve_lamports -= result.amount_out;
    state_.slp_supply -= slp_amount;

    SLP_LOG_DEBUG(log::stake) << "Withdraw " << slp_amount << " slpSOL -> "
                              << format_sol(result.amount_out) << " SOL";
    return result;
}

ErrorCode StakePool::accrue_rewards(const Identity& caller, lamports_t rewards) {
    if (caller != config_.authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    if (state_.total_sol() + rewards > U64_MAX) {
        return ErrorCode::MATH_OVERFLOW;
    }
    state_.total_staked += rewards;
    log::stake.info() << "Accrued " << format_sol(rewards) << " SOL rewards, rate now "
                      << state_.exchange_rate();
    return ErrorCode::OK;
}

ErrorCode StakePool::set_paused(const Identity& caller, bool paused) {
    if (caller != config_.authority) {
        return ErrorCode::UNAUTHORIZED;
    }
    paused_ = paused;
    return ErrorCode::OK;
}

// ============================================================================
// ExecutionTarget
// ============================================================================

ExecutionQuote StakePool::quote(IntentKind kind, lamports_t amount_in) const {
    StakeResult r = kind == IntentKind::STAKE ? quote_deposit(amount_in) : quote_withdraw(amount_in);
    return ExecutionQuote{r.amount_out, 0, r.error};
}

ExecutionQuote StakePool::execute(IntentKind kind, lamports_t amount_in) {
    StakeResult r = kind == IntentKind::STAKE ? deposit(amount_in) : withdraw(amount_in);
    return ExecutionQuote{r.amount_out, 0, r.error};
}

}  // namespace slp
