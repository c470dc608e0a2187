#include "orchestrator.hh"
#include "core/logging.hh"
#include "mempool/visibility.hh"
#include "protocol/commit_reveal.hh"
#include <stdexcept>

namespace slp {

namespace {

std::uint64_t resolve_seed(const std::optional<std::uint64_t>& configured) {
    if (configured) {
        return *configured;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | rd();
}

std::vector<Identity> make_traders(std::string_view prefix, std::uint32_t count) {
    std::vector<Identity> traders;
    traders.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        traders.push_back(Identity::from_label(std::string(prefix) + "-" + std::to_string(i)));
    }
    return traders;
}

MarketConfig market_for(const SimulationConfig& config) {
    MarketConfig market;
    market.fee_bps = config.fee_bps;
    return market;
}

}  // namespace

SimulationOrchestrator::SimulationOrchestrator(SimulationConfig config)
    : config_(std::move(config))
    , seed_(resolve_seed(config_.seed))
    , rng_(seed_)
    , nonce_drbg_(HashDRBG::from_u64(seed_))
    , deterministic_nonces_(config_.seed.has_value())
    , clock_(config_.start_time)
    , pool_(market_for(config_))
    , attacker_(Identity::from_label("sandwich-attacker"), config_.attacker_capital, config_.attacker_capital)
    , normal_traders_(make_traders("normal-trader", config_.num_traders))
    , protected_traders_(make_traders("protected-trader", config_.num_traders)) {

    if (auto problem = config_.validate()) {
        log::simulation.error() << "Invalid simulation config: " << *problem;
        throw std::invalid_argument(*problem);
    }

    Identity provider = Identity::from_label("liquidity-provider");
    DepositResult seeded = pool_.add_liquidity(provider, config_.initial_liquidity, config_.initial_liquidity);
    if (!seeded.ok()) {
        log::simulation.error() << "Pool seeding failed: " << error_code_string(seeded.error);
        throw std::invalid_argument(std::string("pool seeding failed: ") +
                                    std::string(error_code_string(seeded.error)));
    }

    log::simulation.info() << "Pool seeded with " << format_sol(config_.initial_liquidity)
                           << " SOL per side, fee " << config_.fee_bps << " bps, seed " << seed_;
}

nonce_t SimulationOrchestrator::next_nonce() {
    return deterministic_nonces_ ? nonce_drbg_.next_nonce() : random_nonce();
}

PoolStateRecord SimulationOrchestrator::snapshot(const AmmPool& pool, std::uint32_t id, ScenarioKind kind) const {
    PoolStateRecord record;
    record.transaction_id = id;
    record.reserve_a = pool.state().reserve_a;
    record.reserve_b = pool.state().reserve_b;
    record.price_a_in_b = pool.state().price_a_in_b();
    record.scenario = kind;
    return record;
}

// ============================================================================
// Run
// ============================================================================

SimulationResults SimulationOrchestrator::run() {
    SimulationResults results;
    results.config = config_;
    results.seed = seed_;
    results.scenarios.reserve(config_.num_transactions);

    auto started = std::chrono::steady_clock::now();
    std::uniform_int_distribution<lamports_t> amount_dist(config_.min_swap, config_.max_swap);
    std::bernoulli_distribution direction_dist(0.5);
    std::bernoulli_distribution attack_dist(config_.attack_probability);

    std::uint32_t progress_step = std::max<std::uint32_t>(1, config_.num_transactions / 10);

    for (std::uint32_t i = 0; i < config_.num_transactions; ++i) {
        lamports_t amount = amount_dist(rng_);
        SwapDirection direction = direction_dist(rng_) ? SwapDirection::A_TO_B : SwapDirection::B_TO_A;
        bool attack = attack_dist(rng_);

        try {
            results.scenarios.push_back(run_scenario(i, amount, direction, attack));
        } catch (const std::exception& e) {
            log::simulation.error() << "Scenario " << i << " failed: " << e.what();
            ScenarioResult failed;
            failed.id = i;
            failed.amount = amount;
            failed.direction = direction;
            failed.failed = true;
            failed.error = e.what();
            results.scenarios.push_back(std::move(failed));
        }

        if ((i + 1) % progress_step == 0) {
            log::simulation.info() << "Completed " << (i + 1) << "/" << config_.num_transactions << " scenarios";
        }
    }

    results.summary = summarize(results.scenarios);
    results.final_pool = pool_.state();
    results.attacker_total_profit = attacker_.total_profit();
    results.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    log::simulation.info() << "Simulation complete: " << results.summary.successful_attacks << "/"
                           << results.summary.attack_attempts << " attacks succeeded, victims lost "
                           << format_sol(results.summary.total_victim_losses) << " SOL";
    return results;
}

ScenarioResult SimulationOrchestrator::run_scenario(std::uint32_t id, lamports_t amount,
                                                    SwapDirection direction, bool attack) {
    ScenarioResult scenario;
    scenario.id = id;
    scenario.amount = amount;
    scenario.direction = direction;

    const Identity& normal_trader = normal_traders_[id % normal_traders_.size()];
    const Identity& protected_trader = protected_traders_[id % protected_traders_.size()];

    // Both halves start from the same snapshot
    AmmPool normal_pool = pool_;
    AmmPool protected_pool = pool_;

    SLP_LOG_DEBUG(log::simulation) << "Scenario " << id << ": " << format_sol(amount) << " "
                                   << swap_direction_string(direction) << (attack ? " (attacker active)" : "");

    scenario.normal_trade = run_normal(normal_pool, normal_trader, amount, direction, attack, scenario);
    scenario.normal_pool = snapshot(normal_pool, id, ScenarioKind::NORMAL);

    scenario.protected_trade = run_protected(protected_pool, protected_trader, amount, direction);
    scenario.protected_pool = snapshot(protected_pool, id, ScenarioKind::PROTECTED);

    pool_ = std::move(protected_pool);
    clock_.advance(1);
    return scenario;
}

// ============================================================================
// Normal (direct swap) half
// ============================================================================

TradeResult SimulationOrchestrator::run_normal(AmmPool& pool, const Identity& trader, lamports_t amount,
                                               SwapDirection direction, bool attack,
                                               ScenarioResult& scenario) {
    TradeResult trade;
    trade.trader = trader;
    trade.amount_in = amount;
    trade.direction = direction;
    trade.timestamp = clock_.now();

    SwapQuote expected = pool.quote_swap(direction, amount);
    trade.expected_out = expected.amount_out;
    lamports_t min_out = config_.normal_slippage_bps == 0
                             ? 0
                             : min_output_with_slippage(expected.amount_out, config_.normal_slippage_bps);

    Transaction tx = Transaction::direct_swap(trader, amount, min_out, direction);
    trade.signature = tx.signature();

    std::optional<SandwichOutcome> outcome;
    if (attack) {
        scenario.attack_attempted = true;
        VisibleFields view = observe(tx);
        auto pending = to_pending_swap(view);
        std::optional<SandwichParams> plan;
        if (pending) {
            plan = attacker_.plan(*pending, pool.state());
        }

        SandwichResult record;
        if (plan) {
            outcome = attacker_.execute(pool, *pending, *plan);
            record.success = outcome->success;
            record.profit_lamports = outcome->realized_profit;
            record.victim_loss = outcome->victim_loss;
            record.frontrun_amount = plan->front_run_amount;
            record.frontrun_received = outcome->front_run_received;
            record.backrun_amount = outcome->front_run_received;
            record.backrun_received = outcome->back_run_received;
            record.expected_profit = plan->expected_profit;
            record.reason = outcome->reason;
            scenario.attack_succeeded = outcome->success;
        } else {
            record.reason = pending ? "attack not profitable" : "transaction not sandwichable";
        }
        scenario.sandwich = record;
    }

    SwapQuote executed = settle_victim(pool, PendingSwap{trader, amount, direction, min_out}, outcome);

    trade.executed = executed.ok();
    if (!trade.executed) {
        trade.error = std::string(error_code_string(executed.error));
        return trade;
    }

    trade.actual_out = executed.amount_out;
    trade.fee_paid = executed.fee;
    trade.price_impact_bps = executed.price_impact_bps;
    trade.slippage_loss = trade.expected_out > trade.actual_out ? trade.expected_out - trade.actual_out : 0;
    trade.was_attacked = scenario.attack_succeeded;
    return trade;
}

// ============================================================================
// Protected (commit-reveal) half
// ============================================================================

TradeResult SimulationOrchestrator::run_protected(AmmPool& pool, const Identity& trader, lamports_t amount,
                                                  SwapDirection direction) {
    TradeResult trade;
    trade.trader = trader;
    trade.amount_in = amount;
    trade.direction = direction;

    IntentKind kind = direction == SwapDirection::A_TO_B ? IntentKind::STAKE : IntentKind::UNSTAKE;
    CommitRevealProtocol protocol(pool, clock_);

    SwapQuote expected = pool.quote_swap(direction, amount);
    trade.expected_out = expected.amount_out;
    lamports_t min_out = min_output_with_slippage(expected.amount_out, config_.protected_slippage_bps);

    PreparedIntent intent = prepare_intent(amount, min_out, config_.protected_slippage_bps, next_nonce());

    // The attacker watches the commit but learns only a hash
    Transaction commit_tx = Transaction::commit(trader, intent.hash, amount, kind);
    VisibleFields commit_view = observe(commit_tx);
    if (to_pending_swap(commit_view)) {
        trade.was_attacked = true;
    }

    CommitResult committed = protocol.commit(trader, amount, kind, intent.hash);
    if (!committed.success) {
        trade.error = std::string(error_code_string(committed.error));
        return trade;
    }

    clock_.advance(config_.reveal_delay_seconds);

    Transaction reveal_tx = Transaction::reveal(trader, intent.details, kind);
    trade.signature = reveal_tx.signature();
    if (to_pending_swap(observe(reveal_tx))) {
        trade.was_attacked = true;
    }

    ExecutionReceipt receipt = protocol.reveal_and_execute(trader, intent.details);
    secure_zero(intent.details.nonce);
    trade.timestamp = receipt.executed_at;
    trade.executed = receipt.success;
    if (!receipt.success) {
        trade.error = std::string(error_code_string(receipt.error));
        // Reclaim the rent of an unusable commitment
        CancelResult cancelled = protocol.cancel(trader, trader);
        if (!cancelled.success) {
            log::simulation.warn() << "Cancel after failed reveal also failed: "
                                   << error_code_string(cancelled.error);
        }
        return trade;
    }

    trade.actual_out = receipt.amount_out;
    trade.fee_paid = receipt.fee;
    trade.price_impact_bps = expected.price_impact_bps;
    trade.slippage_loss = trade.expected_out > trade.actual_out ? trade.expected_out - trade.actual_out : 0;
    return trade;
}

}  // namespace slp
