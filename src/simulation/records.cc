#include "records.hh"

namespace slp {

SimulationSummary summarize(const std::vector<ScenarioResult>& scenarios) {
    SimulationSummary summary;

    for (const auto& s : scenarios) {
        if (s.failed) {
            ++summary.failed_scenarios;
            continue;
        }

        ++summary.total_transactions;
        ++summary.normal_transactions;
        ++summary.protected_transactions;
        summary.total_volume += s.amount;

        if (s.attack_attempted) {
            ++summary.attack_attempts;
        }
        if (s.normal_trade.was_attacked) {
            ++summary.normal_attacked;
        }
        if (s.protected_trade.was_attacked) {
            ++summary.protected_attacked;
        }
        if (s.sandwich) {
            // Executed-but-failed sandwiches still moved funds
            summary.total_mev_extracted += s.sandwich->profit_lamports;
            summary.total_victim_losses += s.sandwich->victim_loss;
            if (s.attack_succeeded) {
                ++summary.successful_attacks;
            }
        }
    }

    if (summary.attack_attempts > 0) {
        summary.attack_success_rate = static_cast<double>(summary.successful_attacks) * 100.0 /
                                      static_cast<double>(summary.attack_attempts);
    }
    if (summary.successful_attacks > 0) {
        summary.avg_loss_per_attack = summary.total_victim_losses / summary.successful_attacks;
    }
    if (summary.total_transactions > 0) {
        summary.avg_trade_amount = summary.total_volume / summary.total_transactions;
    }
    // Every lamport a victim lost to a sandwich is kept by the protected twin
    summary.total_protected_savings = summary.total_victim_losses;

    return summary;
}

}  // namespace slp
