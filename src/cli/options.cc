#include "options.hh"
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace slp {

namespace {

template<typename T>
bool parse_integer(const std::string& text, T& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool parse_probability(const std::string& text, double& out) {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return !text.empty() && end == text.c_str() + text.size();
}

CommandLine fail(CommandLine cmd, std::string message) {
    cmd.error = std::move(message);
    return cmd;
}

}  // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;
    if (args.empty()) {
        return cmd;
    }

    const std::string& verb = args[0];
    if (verb == "run") {
        cmd.command = CommandKind::RUN;
    } else if (verb == "report") {
        cmd.command = CommandKind::REPORT;
    } else if (verb == "explain") {
        cmd.command = CommandKind::EXPLAIN;
    } else if (verb == "help" || verb == "--help" || verb == "-h") {
        cmd.command = CommandKind::HELP;
        return cmd;
    } else {
        return fail(cmd, "unknown command '" + verb + "'");
    }

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--verbose" || arg == "-v") {
            cmd.log_level = LogLevel::DEBUG;
        } else if (arg == "--log-level" && has_value) {
            auto level = parse_log_level(args[++i]);
            if (!level) return fail(cmd, "unknown log level '" + args[i] + "'");
            cmd.log_level = *level;
        } else if (arg == "--log-file" && has_value) {
            cmd.log_file = args[++i];
        } else if (cmd.command != CommandKind::RUN) {
            if (cmd.command == CommandKind::REPORT && cmd.results_file.empty() && arg.rfind("--", 0) != 0) {
                cmd.results_file = arg;
            } else {
                return fail(cmd, "unexpected argument '" + arg + "'");
            }
        } else if (arg == "--transactions" && has_value) {
            if (!parse_integer(args[++i], cmd.config.num_transactions)) {
                return fail(cmd, "invalid --transactions '" + args[i] + "'");
            }
        } else if (arg == "--attack-prob" && has_value) {
            if (!parse_probability(args[++i], cmd.config.attack_probability)) {
                return fail(cmd, "invalid --attack-prob '" + args[i] + "'");
            }
        } else if ((arg == "--min-swap" || arg == "--max-swap" || arg == "--liquidity" ||
                    arg == "--capital") && has_value) {
            auto lamports = parse_sol(args[++i]);
            if (!lamports) {
                return fail(cmd, "invalid " + arg + " '" + args[i] + "' (expected SOL amount)");
            }
            if (arg == "--min-swap") cmd.config.min_swap = *lamports;
            else if (arg == "--max-swap") cmd.config.max_swap = *lamports;
            else if (arg == "--liquidity") cmd.config.initial_liquidity = *lamports;
            else cmd.config.attacker_capital = *lamports;
        } else if (arg == "--fee-bps" && has_value) {
            if (!parse_integer(args[++i], cmd.config.fee_bps)) {
                return fail(cmd, "invalid --fee-bps '" + args[i] + "'");
            }
        } else if (arg == "--seed" && has_value) {
            std::uint64_t seed = 0;
            if (!parse_integer(args[++i], seed)) {
                return fail(cmd, "invalid --seed '" + args[i] + "'");
            }
            cmd.config.seed = seed;
        } else if (arg == "--output" && has_value) {
            cmd.config.output_dir = args[++i];
        } else {
            return fail(cmd, "unknown or incomplete option '" + arg + "'");
        }
    }

    if (cmd.command == CommandKind::REPORT && cmd.results_file.empty()) {
        return fail(cmd, "report requires a results file");
    }
    if (cmd.command == CommandKind::RUN) {
        if (auto problem = cmd.config.validate()) {
            return fail(cmd, *problem);
        }
    }
    return cmd;
}

std::string usage(std::string_view program) {
    std::ostringstream out;
    out << "Usage:\n"
        << "  " << program << " run [options]         run paired normal/protected scenarios\n"
        << "  " << program << " report <results.json> print the summary of a saved run\n"
        << "  " << program << " explain               describe how commit-reveal blocks sandwiches\n\n"
        << "Run options:\n"
        << "  --transactions N    scenarios to simulate (default 100)\n"
        << "  --attack-prob P     chance the attacker targets a trade (default 0.8)\n"
        << "  --min-swap SOL      smallest trade (default 0.1)\n"
        << "  --max-swap SOL      largest trade (default 5)\n"
        << "  --liquidity SOL     initial reserve per side (default 1000)\n"
        << "  --capital SOL       attacker capital per token (default 500)\n"
        << "  --fee-bps BPS       pool fee (default 30)\n"
        << "  --seed N            seed for a reproducible run\n"
        << "  --output DIR        output directory (default output)\n\n"
        << "Common options:\n"
        << "  --verbose, -v       debug logging\n"
        << "  --log-level LEVEL   trace|debug|info|warn|error|off\n"
        << "  --log-file PATH     also log to a rotating file\n";
    return out.str();
}

}  // namespace slp
