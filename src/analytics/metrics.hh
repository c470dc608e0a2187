#pragma once

#include "simulation/records.hh"
#include <string>
#include <vector>

namespace slp {

// ============================================================================
// Derived Metrics over a finished run
// ============================================================================

struct CumulativePoint {
    std::uint32_t transaction_id = 0;
    std::int64_t value = 0;   // lamports
};

struct HistogramBucket {
    double range_start = 0.0;   // SOL
    double range_end = 0.0;
    std::uint32_t count = 0;
    std::string label;
};

struct PricePoint {
    std::uint32_t transaction_id = 0;
    std::uint64_t price_a_in_b = 0;   // scaled by PRICE_SCALE
};

struct ComparisonMetrics {
    lamports_t normal_total_loss = 0;
    lamports_t protected_total_loss = 0;
    lamports_t savings = 0;
    double savings_percentage = 0.0;
    std::uint64_t attacked_transactions = 0;
    std::uint64_t protected_transactions = 0;
};

inline constexpr std::size_t HISTOGRAM_BUCKETS = 10;

// Running total of attacker profit after each scenario
[[nodiscard]] std::vector<CumulativePoint> cumulative_mev(const std::vector<ScenarioResult>& scenarios);

// Running total of victim losses after each scenario
[[nodiscard]] std::vector<CumulativePoint> cumulative_losses(const std::vector<ScenarioResult>& scenarios);

// Ten equal-width buckets between the smallest and largest nonzero loss
[[nodiscard]] std::vector<HistogramBucket> loss_distribution(const std::vector<ScenarioResult>& scenarios);

// Ten equal-width buckets over all executed sandwiches' profit
[[nodiscard]] std::vector<HistogramBucket> profit_distribution(const std::vector<ScenarioResult>& scenarios);

// Pool price after each normal-half trade
[[nodiscard]] std::vector<PricePoint> price_history(const std::vector<ScenarioResult>& scenarios);

[[nodiscard]] ComparisonMetrics comparison_metrics(const std::vector<ScenarioResult>& scenarios);

}  // namespace slp
