#pragma once

#include "amm/swap_math.hh"
#include "mempool/visibility.hh"
#include <optional>

namespace slp {

// ============================================================================
// Sandwich Search Parameters
// ============================================================================

struct SandwichSearch {
    // Attacks netting this much or less are not worth the transaction risk
    static constexpr std::int64_t MIN_PROFIT_THRESHOLD = 10'000;

    // Front-run candidates: 1%, 3%, ... 49% of min(reserve_in / 2, capital)
    static constexpr std::uint64_t GRID_FIRST_PCT = 1;
    static constexpr std::uint64_t GRID_LAST_PCT = 49;
    static constexpr std::uint64_t GRID_STEP_PCT = 2;
};

// ============================================================================
// Sandwich Plan
// ============================================================================

struct SandwichParams {
    lamports_t front_run_amount = 0;
    lamports_t front_run_output = 0;      // bought in the victim's direction
    lamports_t victim_expected_output = 0;  // without the attack
    lamports_t victim_actual_output = 0;    // after the front-run
    lamports_t back_run_output = 0;       // proceeds from selling front_run_output
    std::int64_t expected_profit = 0;     // back_run_output - front_run_amount
    lamports_t victim_expected_loss = 0;
    bool is_profitable = false;
};

// Evaluate a single front-run size on a copy of the pool. nullopt when any
// leg fails a swap check or the victim's min_out would make it revert.
[[nodiscard]] std::optional<SandwichParams> simulate_sandwich(const PendingSwap& victim,
                                                              const PoolState& pool,
                                                              lamports_t front_run_amount);

// Grid search for the most profitable front-run. nullopt when the best
// candidate does not clear MIN_PROFIT_THRESHOLD or capital cannot fund a step.
[[nodiscard]] std::optional<SandwichParams> find_optimal_attack(const PendingSwap& victim,
                                                                const PoolState& pool,
                                                                lamports_t attacker_capital);

}  // namespace slp
