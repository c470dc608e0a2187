#pragma once

#include "amm/swap_math.hh"
#include "core/execution.hh"
#include <unordered_map>

namespace slp {

// ============================================================================
// Market Configuration
// ============================================================================

// Mint identities are fixed per pool and passed in explicitly
struct MarketConfig {
    Identity mint_a = Identity::from_label("mint:SOL");
    Identity mint_b = Identity::from_label("mint:slpSOL");
    Identity authority = Identity::from_label("pool-authority");
    bps_t fee_bps = DEFAULT_FEE_BPS;
};

// ============================================================================
// AMM Pool - constant-product pool over two mints
// ============================================================================

class AmmPool : public ExecutionTarget {
public:
    explicit AmmPool(MarketConfig config = MarketConfig{});

    // Liquidity
    DepositResult add_liquidity(const Identity& provider, lamports_t amount_a, lamports_t amount_b);
    WithdrawResult remove_liquidity(const Identity& provider, std::uint64_t lp_amount);
    [[nodiscard]] std::uint64_t lp_balance(const Identity& provider) const;

    // Swaps. Fails with SLIPPAGE_TOO_HIGH when output < min_out.
    SwapQuote swap(SwapDirection dir, lamports_t amount_in, lamports_t min_out);
    SwapQuote swap_by_mint(const Identity& mint_in, lamports_t amount_in, lamports_t min_out);
    [[nodiscard]] SwapQuote quote_swap(SwapDirection dir, lamports_t amount_in) const;

    // Administration (authority only)
    ErrorCode set_paused(const Identity& caller, bool paused);
    ErrorCode update_fee(const Identity& caller, bps_t fee_bps);

    // ExecutionTarget
    [[nodiscard]] ExecutionQuote quote(IntentKind kind, lamports_t amount_in) const override;
    ExecutionQuote execute(IntentKind kind, lamports_t amount_in) override;
    [[nodiscard]] std::string_view venue_name() const override { return "amm"; }

    // Accessors
    [[nodiscard]] const PoolState& state() const { return state_; }
    [[nodiscard]] const MarketConfig& config() const { return config_; }
    [[nodiscard]] bool is_paused() const { return paused_; }
    [[nodiscard]] lamports_t cumulative_fee_a() const { return cumulative_fee_a_; }
    [[nodiscard]] lamports_t cumulative_fee_b() const { return cumulative_fee_b_; }
    [[nodiscard]] std::uint64_t swap_count() const { return swap_count_; }

private:
    MarketConfig config_;
    PoolState state_;
    bool paused_ = false;
    lamports_t cumulative_fee_a_ = 0;
    lamports_t cumulative_fee_b_ = 0;
    std::uint64_t swap_count_ = 0;
    std::unordered_map<Identity, std::uint64_t> lp_balances_;
};

}  // namespace slp
