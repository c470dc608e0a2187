#include "results_store.hh"
#include "analytics/metrics.hh"
#include "core/logging.hh"
#include <charconv>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace slp {

using nlohmann::json;

namespace {

// ============================================================================
// Amount Encoding
// ============================================================================

std::string amount(std::uint64_t v) { return std::to_string(v); }
std::string amount(std::int64_t v) { return std::to_string(v); }

template<typename T>
T parse_amount(const json& j, const char* key) {
    if (!j.contains(key)) {
        throw std::runtime_error(std::string("missing field '") + key + "'");
    }
    const json& value = j.at(key);
    if (value.is_number_integer()) {
        if constexpr (std::is_unsigned_v<T>) {
            if (!value.is_number_unsigned()) {
                throw std::runtime_error(std::string("field '") + key + "' is negative");
            }
        } else {
            if (value.is_number_unsigned() &&
                value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                throw std::runtime_error(std::string("field '") + key + "' is out of range");
            }
        }
        return value.get<T>();
    }
    if (!value.is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' is not an amount");
    }
    const std::string& s = value.get_ref<const std::string&>();
    T out{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw std::runtime_error(std::string("field '") + key + "' has malformed amount '" + s + "'");
    }
    return out;
}

lamports_t u64_field(const json& j, const char* key) { return parse_amount<std::uint64_t>(j, key); }
std::int64_t i64_field(const json& j, const char* key) { return parse_amount<std::int64_t>(j, key); }

SwapDirection direction_from(const std::string& s) {
    if (s == swap_direction_string(SwapDirection::A_TO_B)) return SwapDirection::A_TO_B;
    if (s == swap_direction_string(SwapDirection::B_TO_A)) return SwapDirection::B_TO_A;
    throw std::runtime_error("unknown direction '" + s + "'");
}

Identity identity_from(const std::string& s) {
    auto id = Identity::from_hex(s);
    if (!id) {
        throw std::runtime_error("malformed identity '" + s + "'");
    }
    return *id;
}

// ============================================================================
// Records
// ============================================================================

json trade_to_json(const TradeResult& t) {
    return json{
        {"signature", t.signature},
        {"trader", t.trader.to_hex()},
        {"amount_in", amount(t.amount_in)},
        {"direction", std::string(swap_direction_string(t.direction))},
        {"expected_out", amount(t.expected_out)},
        {"actual_out", amount(t.actual_out)},
        {"slippage_loss", amount(t.slippage_loss)},
        {"was_attacked", t.was_attacked},
        {"fee_paid", amount(t.fee_paid)},
        {"price_impact_bps", t.price_impact_bps},
        {"timestamp", t.timestamp},
        {"executed", t.executed},
        {"error", t.error},
    };
}

TradeResult trade_from_json(const json& j) {
    TradeResult t;
    t.signature = j.at("signature").get<std::string>();
    t.trader = identity_from(j.at("trader").get<std::string>());
    t.amount_in = u64_field(j, "amount_in");
    t.direction = direction_from(j.at("direction").get<std::string>());
    t.expected_out = u64_field(j, "expected_out");
    t.actual_out = u64_field(j, "actual_out");
    t.slippage_loss = u64_field(j, "slippage_loss");
    t.was_attacked = j.at("was_attacked").get<bool>();
    t.fee_paid = u64_field(j, "fee_paid");
    t.price_impact_bps = j.at("price_impact_bps").get<std::uint32_t>();
    t.timestamp = j.at("timestamp").get<unix_time_t>();
    t.executed = j.value("executed", true);
    t.error = j.value("error", std::string{});
    return t;
}

json sandwich_to_json(const SandwichResult& s) {
    return json{
        {"success", s.success},
        {"profit_lamports", amount(s.profit_lamports)},
        {"victim_loss", amount(s.victim_loss)},
        {"frontrun_amount", amount(s.frontrun_amount)},
        {"frontrun_received", amount(s.frontrun_received)},
        {"backrun_amount", amount(s.backrun_amount)},
        {"backrun_received", amount(s.backrun_received)},
        {"expected_profit", amount(s.expected_profit)},
        {"reason", s.reason},
    };
}

SandwichResult sandwich_from_json(const json& j) {
    SandwichResult s;
    s.success = j.at("success").get<bool>();
    s.profit_lamports = i64_field(j, "profit_lamports");
    s.victim_loss = u64_field(j, "victim_loss");
    s.frontrun_amount = u64_field(j, "frontrun_amount");
    s.frontrun_received = u64_field(j, "frontrun_received");
    s.backrun_amount = u64_field(j, "backrun_amount");
    s.backrun_received = u64_field(j, "backrun_received");
    s.expected_profit = i64_field(j, "expected_profit");
    s.reason = j.at("reason").get<std::string>();
    return s;
}

json pool_to_json(const PoolStateRecord& p) {
    return json{
        {"transaction_id", p.transaction_id},
        {"reserve_a", amount(p.reserve_a)},
        {"reserve_b", amount(p.reserve_b)},
        {"price_a_in_b", amount(p.price_a_in_b)},
        {"scenario", std::string(scenario_kind_string(p.scenario))},
    };
}

PoolStateRecord pool_from_json(const json& j) {
    PoolStateRecord p;
    p.transaction_id = j.at("transaction_id").get<std::uint32_t>();
    p.reserve_a = u64_field(j, "reserve_a");
    p.reserve_b = u64_field(j, "reserve_b");
    p.price_a_in_b = u64_field(j, "price_a_in_b");
    std::string kind = j.at("scenario").get<std::string>();
    if (kind == scenario_kind_string(ScenarioKind::NORMAL)) {
        p.scenario = ScenarioKind::NORMAL;
    } else if (kind == scenario_kind_string(ScenarioKind::PROTECTED)) {
        p.scenario = ScenarioKind::PROTECTED;
    } else {
        throw std::runtime_error("unknown scenario kind '" + kind + "'");
    }
    return p;
}

json scenario_to_json(const ScenarioResult& s) {
    json j{
        {"id", s.id},
        {"amount", amount(s.amount)},
        {"direction", std::string(swap_direction_string(s.direction))},
        {"attack_attempted", s.attack_attempted},
        {"attack_succeeded", s.attack_succeeded},
        {"failed", s.failed},
        {"error", s.error},
    };
    if (s.failed) {
        return j;
    }
    j["normal_trade"] = trade_to_json(s.normal_trade);
    j["protected_trade"] = trade_to_json(s.protected_trade);
    j["normal_pool"] = pool_to_json(s.normal_pool);
    j["protected_pool"] = pool_to_json(s.protected_pool);
    j["sandwich"] = s.sandwich ? sandwich_to_json(*s.sandwich) : json(nullptr);
    return j;
}

ScenarioResult scenario_from_json(const json& j) {
    ScenarioResult s;
    s.id = j.at("id").get<std::uint32_t>();
    s.amount = u64_field(j, "amount");
    s.direction = direction_from(j.at("direction").get<std::string>());
    s.attack_attempted = j.at("attack_attempted").get<bool>();
    s.attack_succeeded = j.at("attack_succeeded").get<bool>();
    s.failed = j.value("failed", false);
    s.error = j.value("error", std::string{});
    if (s.failed) {
        return s;
    }
    s.normal_trade = trade_from_json(j.at("normal_trade"));
    s.protected_trade = trade_from_json(j.at("protected_trade"));
    s.normal_pool = pool_from_json(j.at("normal_pool"));
    s.protected_pool = pool_from_json(j.at("protected_pool"));
    if (j.contains("sandwich") && !j.at("sandwich").is_null()) {
        s.sandwich = sandwich_from_json(j.at("sandwich"));
    }
    return s;
}

json summary_to_json(const SimulationSummary& s) {
    return json{
        {"total_transactions", s.total_transactions},
        {"failed_scenarios", s.failed_scenarios},
        {"attack_attempts", s.attack_attempts},
        {"successful_attacks", s.successful_attacks},
        {"attack_success_rate", s.attack_success_rate},
        {"normal_transactions", s.normal_transactions},
        {"normal_attacked", s.normal_attacked},
        {"protected_transactions", s.protected_transactions},
        {"protected_attacked", s.protected_attacked},
        {"total_mev_extracted", amount(s.total_mev_extracted)},
        {"total_victim_losses", amount(s.total_victim_losses)},
        {"avg_loss_per_attack", amount(s.avg_loss_per_attack)},
        {"total_protected_savings", amount(s.total_protected_savings)},
        {"avg_trade_amount", amount(s.avg_trade_amount)},
        {"total_volume", amount(s.total_volume)},
    };
}

json config_to_json(const SimulationConfig& c) {
    json j{
        {"transactions", c.num_transactions},
        {"attack_probability", c.attack_probability},
        {"min_swap_lamports", amount(c.min_swap)},
        {"max_swap_lamports", amount(c.max_swap)},
        {"initial_pool_liquidity", amount(c.initial_liquidity)},
        {"fee_bps", c.fee_bps},
        {"attacker_capital", amount(c.attacker_capital)},
        {"num_traders", c.num_traders},
        {"normal_slippage_bps", c.normal_slippage_bps},
        {"protected_slippage_bps", c.protected_slippage_bps},
        {"start_time", c.start_time},
        {"reveal_delay_seconds", c.reveal_delay_seconds},
        {"output_dir", c.output_dir},
    };
    j["seed"] = c.seed ? json(amount(*c.seed)) : json(nullptr);
    return j;
}

SimulationConfig config_from_json(const json& j) {
    SimulationConfig c;
    c.num_transactions = j.at("transactions").get<std::uint32_t>();
    c.attack_probability = j.at("attack_probability").get<double>();
    c.min_swap = u64_field(j, "min_swap_lamports");
    c.max_swap = u64_field(j, "max_swap_lamports");
    c.initial_liquidity = u64_field(j, "initial_pool_liquidity");
    c.fee_bps = j.at("fee_bps").get<bps_t>();
    c.attacker_capital = u64_field(j, "attacker_capital");
    c.num_traders = j.value("num_traders", c.num_traders);
    c.normal_slippage_bps = j.value("normal_slippage_bps", c.normal_slippage_bps);
    c.protected_slippage_bps = j.value("protected_slippage_bps", c.protected_slippage_bps);
    c.start_time = j.value("start_time", c.start_time);
    c.reveal_delay_seconds = j.value("reveal_delay_seconds", c.reveal_delay_seconds);
    c.output_dir = j.value("output_dir", c.output_dir);
    if (j.contains("seed") && !j.at("seed").is_null()) {
        c.seed = u64_field(j, "seed");
    }
    return c;
}

}  // namespace

// ============================================================================
// Results <-> JSON
// ============================================================================

json results_to_json(const SimulationResults& results) {
    json scenarios = json::array();
    for (const auto& s : results.scenarios) {
        scenarios.push_back(scenario_to_json(s));
    }

    return json{
        {"version", RESULTS_FORMAT_VERSION},
        {"config", config_to_json(results.config)},
        {"seed", amount(results.seed)},
        {"summary", summary_to_json(results.summary)},
        {"final_pool", json{
            {"reserve_a", amount(results.final_pool.reserve_a)},
            {"reserve_b", amount(results.final_pool.reserve_b)},
            {"fee_bps", results.final_pool.fee_bps},
            {"lp_supply", amount(results.final_pool.lp_supply)},
        }},
        {"attacker_total_profit", amount(results.attacker_total_profit)},
        {"duration_ms", results.duration_ms},
        {"scenarios", std::move(scenarios)},
    };
}

SimulationResults results_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            throw std::runtime_error("results document is not an object");
        }
        int version = j.value("version", 0);
        if (version != RESULTS_FORMAT_VERSION) {
            throw std::runtime_error("unsupported results version " + std::to_string(version));
        }

        SimulationResults results;
        results.config = config_from_json(j.at("config"));
        results.seed = u64_field(j, "seed");
        for (const auto& s : j.at("scenarios")) {
            results.scenarios.push_back(scenario_from_json(s));
        }

        const json& pool = j.at("final_pool");
        results.final_pool.reserve_a = u64_field(pool, "reserve_a");
        results.final_pool.reserve_b = u64_field(pool, "reserve_b");
        results.final_pool.fee_bps = pool.at("fee_bps").get<bps_t>();
        results.final_pool.lp_supply = u64_field(pool, "lp_supply");
        results.attacker_total_profit = i64_field(j, "attacker_total_profit");
        results.duration_ms = j.value("duration_ms", std::int64_t{0});

        // The stored summary is derived data; recompute from the records
        results.summary = summarize(results.scenarios);
        return results;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed results: ") + e.what());
    }
}

// ============================================================================
// Text Report
// ============================================================================

std::string format_summary(const SimulationResults& results) {
    const SimulationSummary& s = results.summary;
    ComparisonMetrics cmp = comparison_metrics(results.scenarios);

    std::ostringstream out;
    out << "SecureLP MEV Simulation Summary\n"
        << "===============================\n\n"
        << "Configuration\n"
        << "  Transactions:        " << results.config.num_transactions << "\n"
        << "  Attack probability:  " << results.config.attack_probability << "\n"
        << "  Swap range:          " << format_sol(results.config.min_swap) << " - "
        << format_sol(results.config.max_swap) << " SOL\n"
        << "  Pool liquidity:      " << format_sol(results.config.initial_liquidity) << " SOL per side\n"
        << "  Fee:                 " << results.config.fee_bps << " bps\n"
        << "  Seed:                " << results.seed << "\n\n"
        << "Attacks\n"
        << "  Attempts:            " << s.attack_attempts << "\n"
        << "  Successful:          " << s.successful_attacks << "\n"
        << "  Success rate:        " << std::fixed << std::setprecision(2) << s.attack_success_rate << "%\n"
        << "  MEV extracted:       " << format_signed_sol(s.total_mev_extracted) << " SOL\n\n"
        << "Normal trades (direct swap)\n"
        << "  Count:               " << s.normal_transactions << "\n"
        << "  Attacked:            " << s.normal_attacked << "\n"
        << "  Victim losses:       " << format_sol(s.total_victim_losses) << " SOL\n"
        << "  Avg loss per attack: " << format_sol(s.avg_loss_per_attack) << " SOL\n\n"
        << "Protected trades (commit-reveal)\n"
        << "  Count:               " << s.protected_transactions << "\n"
        << "  Attacked:            " << s.protected_attacked << "\n"
        << "  Savings:             " << format_sol(s.total_protected_savings) << " SOL\n\n"
        << "Comparison\n"
        << "  Normal total loss:    " << format_sol(cmp.normal_total_loss) << " SOL\n"
        << "  Protected total loss: " << format_sol(cmp.protected_total_loss) << " SOL\n"
        << "  Savings:              " << std::setprecision(2) << cmp.savings_percentage << "%\n\n"
        << "Volume\n"
        << "  Total:               " << format_sol(s.total_volume) << " SOL\n"
        << "  Average trade:       " << format_sol(s.avg_trade_amount) << " SOL\n";

    if (s.failed_scenarios > 0) {
        out << "\nFailed scenarios:      " << s.failed_scenarios << "\n";
    }

    auto losses = loss_distribution(results.scenarios);
    if (!losses.empty()) {
        out << "\nVictim loss distribution (SOL)\n";
        for (const auto& b : losses) {
            out << "  " << std::setw(20) << std::left << b.label << " " << b.count << "\n";
        }
    }

    return out.str();
}

// ============================================================================
// Files
// ============================================================================

std::filesystem::path save_results(const SimulationResults& results, const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        log::results.error() << "Cannot create output directory " << dir.string() << ": " << ec.message();
        throw std::runtime_error("cannot create output directory " + dir.string() + ": " + ec.message());
    }

    auto results_path = dir / std::string(RESULTS_FILE_NAME);
    {
        std::ofstream file(results_path);
        if (!file) {
            throw std::runtime_error("cannot open " + results_path.string() + " for writing");
        }
        file << results_to_json(results).dump(2) << "\n";
        if (!file) {
            throw std::runtime_error("failed writing " + results_path.string());
        }
    }

    auto summary_path = dir / std::string(SUMMARY_FILE_NAME);
    {
        std::ofstream file(summary_path);
        if (!file) {
            throw std::runtime_error("cannot open " + summary_path.string() + " for writing");
        }
        file << format_summary(results);
        if (!file) {
            throw std::runtime_error("failed writing " + summary_path.string());
        }
    }

    log::results.info() << "Results written to " << results_path.string();
    return results_path;
}

SimulationResults load_results(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open results file " + path.string());
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("results file " + path.string() + " is not valid JSON: " + e.what());
    }

    SLP_LOG_DEBUG(log::results) << "Loaded " << path.string();
    return results_from_json(j);
}

}  // namespace slp
