#pragma once

#include "amm/swap_math.hh"
#include "core/types.hh"
#include <optional>
#include <string>

namespace slp {

// ============================================================================
// Simulation Configuration
// ============================================================================

struct SimulationConfig {
    // Scenario generation
    std::uint32_t num_transactions = 100;
    double attack_probability = 0.8;
    lamports_t min_swap = 100'000'000;                 // 0.1 SOL
    lamports_t max_swap = 5 * LAMPORTS_PER_SOL;        // 5 SOL
    std::optional<std::uint64_t> seed;                 // random when unset

    // Market
    lamports_t initial_liquidity = 1000 * LAMPORTS_PER_SOL;  // per side
    bps_t fee_bps = DEFAULT_FEE_BPS;

    // Participants
    lamports_t attacker_capital = 500 * LAMPORTS_PER_SOL;    // per token
    std::uint32_t num_traders = 5;                           // per population
    bps_t normal_slippage_bps = 0;        // 0 = no min_out on direct swaps
    bps_t protected_slippage_bps = 100;   // 1%

    // Ledger timing
    unix_time_t start_time = 1'700'000'000;
    std::int64_t reveal_delay_seconds = 1;

    std::string output_dir = "output";

    // nullopt when valid, otherwise a description of the first problem
    [[nodiscard]] std::optional<std::string> validate() const;
};

}  // namespace slp
