#pragma once

#include "amm/pool.hh"
#include "mev/sandwich.hh"
#include <string>

namespace slp {

// ============================================================================
// Sandwich Outcome (one executed front-run / victim / back-run sequence)
// ============================================================================

struct SandwichOutcome {
    bool success = false;
    std::string reason;
    SandwichParams plan;

    lamports_t front_run_received = 0;
    lamports_t victim_received = 0;
    lamports_t back_run_received = 0;
    bool victim_leg_ran = false;     // false when the sandwich aborted before the victim
    bool victim_executed = false;
    SwapQuote victim_quote;

    // Balance delta of the input token across the three legs
    std::int64_t realized_profit = 0;
    lamports_t victim_loss = 0;
};

// The victim's fill: the leg that ran inside the sandwich, or a plain swap at
// the victim's own limit when no sandwich reached it
SwapQuote settle_victim(AmmPool& pool, const PendingSwap& victim,
                        const std::optional<SandwichOutcome>& outcome);

// ============================================================================
// Sandwich Attacker - holds balances in both pool tokens
// ============================================================================

class SandwichAttacker {
public:
    SandwichAttacker(Identity identity, lamports_t balance_a, lamports_t balance_b);

    // Capital is the attacker's balance of the victim's input token
    [[nodiscard]] std::optional<SandwichParams> plan(const PendingSwap& victim,
                                                     const PoolState& pool) const;

    // Front-run, victim, back-run, strictly in that order against the live pool
    SandwichOutcome execute(AmmPool& pool, const PendingSwap& victim, const SandwichParams& plan);

    [[nodiscard]] const Identity& identity() const { return identity_; }
    [[nodiscard]] lamports_t balance(SwapDirection input_side) const;
    [[nodiscard]] lamports_t balance_a() const { return balance_a_; }
    [[nodiscard]] lamports_t balance_b() const { return balance_b_; }
    [[nodiscard]] std::uint64_t attacks_executed() const { return attacks_executed_; }
    [[nodiscard]] std::int64_t total_profit() const { return total_profit_; }

private:
    Identity identity_;
    lamports_t balance_a_;
    lamports_t balance_b_;
    std::uint64_t attacks_executed_ = 0;
    std::int64_t total_profit_ = 0;

    lamports_t& input_balance(SwapDirection dir) {
        return dir == SwapDirection::A_TO_B ? balance_a_ : balance_b_;
    }
    lamports_t& output_balance(SwapDirection dir) {
        return dir == SwapDirection::A_TO_B ? balance_b_ : balance_a_;
    }
};

}  // namespace slp
