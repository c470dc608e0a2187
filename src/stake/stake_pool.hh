#pragma once

#include "core/execution.hh"

namespace slp {

// ============================================================================
// Stake Pool Configuration
// ============================================================================

struct StakePoolConfig {
    static constexpr lamports_t MIN_DEPOSIT = 10'000'000;       // 0.01 SOL
    static constexpr bps_t RESERVE_RATIO_BPS = 1000;            // 10% kept liquid

    Identity authority = Identity::from_label("stake-pool-authority");
    lamports_t min_deposit = MIN_DEPOSIT;
    bps_t reserve_ratio_bps = RESERVE_RATIO_BPS;
};

// ============================================================================
// Stake Pool State
// ============================================================================

struct StakePoolState {
    lamports_t total_staked = 0;       // delegated SOL
    lamports_t reserve_lamports = 0;   // liquid SOL for instant unstake
    std::uint64_t slp_supply = 0;      // outstanding slpSOL

    [[nodiscard]] u128 total_sol() const {
        return static_cast<u128>(total_staked) + reserve_lamports;
    }

    // SOL per slpSOL scaled by PRICE_SCALE; 1:1 for an empty pool
    [[nodiscard]] std::uint64_t exchange_rate() const;

    bool operator==(const StakePoolState&) const = default;
};

struct StakeResult {
    lamports_t amount_in = 0;
    lamports_t amount_out = 0;
    lamports_t to_reserve = 0;
    ErrorCode error = ErrorCode::OK;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

// ============================================================================
// Stake Pool - SOL <-> slpSOL at the pool exchange rate
// ============================================================================

class StakePool : public ExecutionTarget {
public:
    explicit StakePool(StakePoolConfig config = StakePoolConfig{});

    [[nodiscard]] StakeResult quote_deposit(lamports_t sol_amount) const;
    [[nodiscard]] StakeResult quote_withdraw(std::uint64_t slp_amount) const;

    StakeResult deposit(lamports_t sol_amount);
    StakeResult withdraw(std::uint64_t slp_amount);

    // Staking rewards raise total SOL and therefore the exchange rate
    ErrorCode accrue_rewards(const Identity& caller, lamports_t rewards);
    ErrorCode set_paused(const Identity& caller, bool paused);

    // ExecutionTarget: STAKE deposits SOL, UNSTAKE withdraws slpSOL
    [[nodiscard]] ExecutionQuote quote(IntentKind kind, lamports_t amount_in) const override;
    ExecutionQuote execute(IntentKind kind, lamports_t amount_in) override;
    [[nodiscard]] std::string_view venue_name() const override { return "stake_pool"; }

    [[nodiscard]] const StakePoolState& state() const { return state_; }
    [[nodiscard]] bool is_paused() const { return paused_; }

private:
    StakePoolConfig config_;
    StakePoolState state_;
    bool paused_ = false;
};

}  // namespace slp
