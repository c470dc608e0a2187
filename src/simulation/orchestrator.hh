#pragma once

#include "amm/pool.hh"
#include "crypto/hash.hh"
#include "mev/attacker.hh"
#include "protocol/clock.hh"
#include "simulation/config.hh"
#include "simulation/records.hh"
#include <chrono>
#include <optional>
#include <random>
#include <vector>

namespace slp {

// ============================================================================
// Simulation Results
// ============================================================================

struct SimulationResults {
    SimulationConfig config;
    std::uint64_t seed = 0;
    std::vector<ScenarioResult> scenarios;
    SimulationSummary summary;
    PoolState final_pool;
    std::int64_t attacker_total_profit = 0;
    std::int64_t duration_ms = 0;
};

// ============================================================================
// Simulation Orchestrator
// ============================================================================
//
// Each scenario draws (amount, direction) and an attack decision, then runs
// the same trade twice from the same pool snapshot:
//   normal    - direct swap, visible in the mempool, exposed to the attacker
//   protected - commit, delay, reveal-and-execute through the protocol
// The live pool advances with the protected outcome.

class SimulationOrchestrator {
public:
    // Throws std::invalid_argument on an invalid config or failed pool setup
    explicit SimulationOrchestrator(SimulationConfig config);

    [[nodiscard]] SimulationResults run();

    // One paired scenario with explicit inputs
    ScenarioResult run_scenario(std::uint32_t id, lamports_t amount, SwapDirection direction, bool attack);

    [[nodiscard]] const AmmPool& pool() const { return pool_; }
    [[nodiscard]] const SandwichAttacker& attacker() const { return attacker_; }
    [[nodiscard]] const SimulationConfig& config() const { return config_; }
    [[nodiscard]] std::uint64_t seed() const { return seed_; }

private:
    SimulationConfig config_;
    std::uint64_t seed_;
    std::mt19937_64 rng_;
    HashDRBG nonce_drbg_;
    bool deterministic_nonces_;
    ManualLedgerClock clock_;
    AmmPool pool_;
    SandwichAttacker attacker_;
    std::vector<Identity> normal_traders_;
    std::vector<Identity> protected_traders_;

    TradeResult run_normal(AmmPool& pool, const Identity& trader, lamports_t amount,
                           SwapDirection direction, bool attack, ScenarioResult& scenario);
    TradeResult run_protected(AmmPool& pool, const Identity& trader, lamports_t amount,
                              SwapDirection direction);

    [[nodiscard]] nonce_t next_nonce();
    [[nodiscard]] PoolStateRecord snapshot(const AmmPool& pool, std::uint32_t id, ScenarioKind kind) const;
};

}  // namespace slp
