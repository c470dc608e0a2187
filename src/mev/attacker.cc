#include "attacker.hh"
#include "core/logging.hh"

namespace slp {

SwapQuote settle_victim(AmmPool& pool, const PendingSwap& victim,
                        const std::optional<SandwichOutcome>& outcome) {
    if (outcome && outcome->victim_leg_ran) {
        return outcome->victim_quote;
    }
    return pool.swap(victim.direction, victim.amount_in, victim.min_out);
}

SandwichAttacker::SandwichAttacker(Identity identity, lamports_t balance_a, lamports_t balance_b)
    : identity_(std::move(identity))
    , balance_a_(balance_a)
    , balance_b_(balance_b) {}

lamports_t SandwichAttacker::balance(SwapDirection input_side) const {
    return input_side == SwapDirection::A_TO_B ? balance_a_ : balance_b_;
}

std::optional<SandwichParams> SandwichAttacker::plan(const PendingSwap& victim,
                                                     const PoolState& pool) const {
    return find_optimal_attack(victim, pool, balance(victim.direction));
}

SandwichOutcome SandwichAttacker::execute(AmmPool& pool, const PendingSwap& victim,
                                          const SandwichParams& plan) {
    SandwichOutcome outcome;
    outcome.plan = plan;

    SwapDirection dir = victim.direction;
    SwapDirection back_dir = dir == SwapDirection::A_TO_B ? SwapDirection::B_TO_A : SwapDirection::A_TO_B;

    if (input_balance(dir) < plan.front_run_amount) {
        outcome.reason = "insufficient attacker balance";
        return outcome;
    }

    const lamports_t before = input_balance(dir);
    SwapQuote undisturbed = pool.quote_swap(dir, victim.amount_in);

    // Leg 1: front-run in the victim's direction
    SwapQuote front = pool.swap(dir, plan.front_run_amount, 0);
    if (!front.ok()) {
        outcome.reason = std::string("front-run failed: ") + std::string(error_code_string(front.error));
        return outcome;
    }
    input_balance(dir) -= plan.front_run_amount;
    output_balance(dir) += front.amount_out;
    outcome.front_run_received = front.amount_out;

    // Leg 2: victim executes at the worsened price
    outcome.victim_leg_ran = true;
    outcome.victim_quote = pool.swap(dir, victim.amount_in, victim.min_out);
    outcome.victim_executed = outcome.victim_quote.ok();
    if (outcome.victim_executed) {
        outcome.victim_received = outcome.victim_quote.amount_out;
    }

    // Leg 3: back-run sells exactly what the front-run bought
    SwapQuote back = pool.swap(back_dir, front.amount_out, 0);
    if (!back.ok()) {
        outcome.reason = std::string("back-run failed: ") + std::string(error_code_string(back.error));
        log::attacker.warn() << outcome.reason;
        return outcome;
    }
    output_balance(dir) -= front.amount_out;
    input_balance(dir) += back.amount_out;
    outcome.back_run_received = back.amount_out;

    outcome.realized_profit = static_cast<std::int64_t>(input_balance(dir)) - static_cast<std::int64_t>(before);
    if (outcome.victim_executed && undisturbed.ok() && undisturbed.amount_out > outcome.victim_received) {
        outcome.victim_loss = undisturbed.amount_out - outcome.victim_received;
    }

    ++attacks_executed_;
    total_profit_ += outcome.realized_profit;

    if (!outcome.victim_executed) {
        outcome.reason = std::string("victim reverted: ") +
                         std::string(error_code_string(outcome.victim_quote.error));
    } else if (outcome.realized_profit <= 0) {
        outcome.reason = "unprofitable after execution";
    } else {
        outcome.success = true;
        outcome.reason = "sandwich executed";
    }

    SLP_LOG_DEBUG(log::attacker) << "Sandwich on " << victim.trader.short_hex()
                                 << ": front=" << plan.front_run_amount
                                 << " back=" << back.amount_out
                                 << " profit=" << outcome.realized_profit
                                 << " victim_loss=" << outcome.victim_loss;
    return outcome;
}

}  // namespace slp
