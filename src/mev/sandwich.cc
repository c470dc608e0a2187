#include "sandwich.hh"
#include "core/logging.hh"
#include <algorithm>

namespace slp {

namespace {

SwapDirection opposite(SwapDirection dir) {
    return dir == SwapDirection::A_TO_B ? SwapDirection::B_TO_A : SwapDirection::A_TO_B;
}

}  // namespace

std::optional<SandwichParams> simulate_sandwich(const PendingSwap& victim,
                                                const PoolState& pool,
                                                lamports_t front_run_amount) {
    SwapQuote undisturbed = quote_swap(pool, victim.amount_in, victim.direction);
    if (!undisturbed.ok()) {
        return std::nullopt;
    }

    PoolState sim = pool;

    SwapQuote front = apply_swap(sim, front_run_amount, victim.direction);
    if (!front.ok()) {
        return std::nullopt;
    }

    SwapQuote hit = apply_swap(sim, victim.amount_in, victim.direction);
    if (!hit.ok()) {
        return std::nullopt;
    }
    if (victim.min_out > 0 && hit.amount_out < victim.min_out) {
        // Victim would revert and the attacker would be left holding the front-run
        return std::nullopt;
    }

    SwapQuote back = apply_swap(sim, front.amount_out, opposite(victim.direction));
    if (!back.ok()) {
        return std::nullopt;
    }

    SandwichParams params;
    params.front_run_amount = front_run_amount;
    params.front_run_output = front.amount_out;
    params.victim_expected_output = undisturbed.amount_out;
    params.victim_actual_output = hit.amount_out;
    params.back_run_output = back.amount_out;
    params.expected_profit = static_cast<std::int64_t>(back.amount_out) -
                             static_cast<std::int64_t>(front_run_amount);
    params.victim_expected_loss = undisturbed.amount_out > hit.amount_out
                                      ? undisturbed.amount_out - hit.amount_out
                                      : 0;
    params.is_profitable = params.expected_profit > SandwichSearch::MIN_PROFIT_THRESHOLD;
    return params;
}

std::optional<SandwichParams> find_optimal_attack(const PendingSwap& victim,
                                                  const PoolState& pool,
                                                  lamports_t attacker_capital) {
    lamports_t base = std::min(pool.reserve_in(victim.direction) / 2, attacker_capital);

    std::optional<SandwichParams> best;
    std::size_t evaluated = 0;

    for (std::uint64_t pct = SandwichSearch::GRID_FIRST_PCT;
         pct <= SandwichSearch::GRID_LAST_PCT;
         pct += SandwichSearch::GRID_STEP_PCT) {
        auto amount = static_cast<lamports_t>(static_cast<u128>(base) * pct / 100);
        if (amount == 0 || amount > attacker_capital) {
            continue;
        }

        auto candidate = simulate_sandwich(victim, pool, amount);
        if (!candidate) {
            continue;
        }
        ++evaluated;

        if (!best || candidate->expected_profit > best->expected_profit) {
            best = candidate;
        }
    }

    if (!best || best->expected_profit <= SandwichSearch::MIN_PROFIT_THRESHOLD) {
        SLP_LOG_TRACE(log::sandwich) << "No profitable sandwich for " << victim.amount_in
                                     << " (" << evaluated << " feasible candidates)";
        return std::nullopt;
    }

    SLP_LOG_DEBUG(log::sandwich) << "Optimal front-run " << best->front_run_amount
                                 << " profit=" << best->expected_profit
                                 << " victim_loss=" << best->victim_expected_loss;
    return best;
}

}  // namespace slp
