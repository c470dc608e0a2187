#pragma once

#include "core/types.hh"
#include <optional>
#include <string>
#include <vector>

namespace slp {

// ============================================================================
// Per-Scenario Records (append-only, created once per scenario)
// ============================================================================

struct TradeResult {
    std::string signature;
    Identity trader;
    lamports_t amount_in = 0;
    SwapDirection direction = SwapDirection::A_TO_B;
    lamports_t expected_out = 0;    // quoted against the undisturbed pool
    lamports_t actual_out = 0;
    lamports_t slippage_loss = 0;   // expected_out - actual_out
    bool was_attacked = false;
    lamports_t fee_paid = 0;
    std::uint32_t price_impact_bps = 0;
    unix_time_t timestamp = 0;
    bool executed = false;
    std::string error;

    // Loss as a percentage of the expected output
    [[nodiscard]] double loss_percentage() const {
        return expected_out == 0 ? 0.0 : static_cast<double>(slippage_loss) * 100.0 / static_cast<double>(expected_out);
    }
};

struct SandwichResult {
    bool success = false;
    std::int64_t profit_lamports = 0;
    lamports_t victim_loss = 0;
    lamports_t frontrun_amount = 0;
    lamports_t frontrun_received = 0;
    lamports_t backrun_amount = 0;
    lamports_t backrun_received = 0;
    std::int64_t expected_profit = 0;   // from simulation before execution
    std::string reason;
};

enum class ScenarioKind : std::uint8_t {
    NORMAL = 0,
    PROTECTED = 1,
};

[[nodiscard]] inline std::string_view scenario_kind_string(ScenarioKind kind) {
    return kind == ScenarioKind::NORMAL ? "normal" : "protected";
}

struct PoolStateRecord {
    std::uint32_t transaction_id = 0;
    lamports_t reserve_a = 0;
    lamports_t reserve_b = 0;
    std::uint64_t price_a_in_b = 0;   // scaled by PRICE_SCALE
    ScenarioKind scenario = ScenarioKind::NORMAL;
};

struct ScenarioResult {
    std::uint32_t id = 0;
    lamports_t amount = 0;
    SwapDirection direction = SwapDirection::A_TO_B;

    bool attack_attempted = false;
    bool attack_succeeded = false;
    std::optional<SandwichResult> sandwich;

    TradeResult normal_trade;
    TradeResult protected_trade;
    PoolStateRecord normal_pool;
    PoolStateRecord protected_pool;

    bool failed = false;
    std::string error;
};

// ============================================================================
// Aggregate Summary
// ============================================================================

struct SimulationSummary {
    std::uint64_t total_transactions = 0;
    std::uint64_t failed_scenarios = 0;
    std::uint64_t attack_attempts = 0;
    std::uint64_t successful_attacks = 0;
    double attack_success_rate = 0.0;       // percent
    std::uint64_t normal_transactions = 0;
    std::uint64_t normal_attacked = 0;
    std::uint64_t protected_transactions = 0;
    std::uint64_t protected_attacked = 0;
    std::int64_t total_mev_extracted = 0;
    lamports_t total_victim_losses = 0;
    lamports_t avg_loss_per_attack = 0;
    lamports_t total_protected_savings = 0;
    lamports_t avg_trade_amount = 0;
    lamports_t total_volume = 0;
};

[[nodiscard]] SimulationSummary summarize(const std::vector<ScenarioResult>& scenarios);

}  // namespace slp
