#include "analytics/results_store.hh"
#include "cli/options.hh"
#include "core/logging.hh"
#include "mempool/visibility.hh"
#include "simulation/orchestrator.hh"
#include <iostream>
#include <stdexcept>

namespace {

int run_simulation(const slp::CommandLine& cmd) {
    slp::SimulationOrchestrator orchestrator(cmd.config);
    slp::SimulationResults results = orchestrator.run();
    slp::save_results(results, cmd.config.output_dir);
    std::cout << slp::format_summary(results);
    return 0;
}

int print_report(const slp::CommandLine& cmd) {
    slp::SimulationResults results = slp::load_results(cmd.results_file);
    std::cout << slp::format_summary(results);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    slp::CommandLine cmd = slp::parse_command_line(args);

    if (!cmd.ok()) {
        std::cerr << "error: " << cmd.error << "\n\n" << slp::usage(argv[0]);
        return 2;
    }

    slp::LogConfig log_config;
    log_config.default_level = cmd.log_level;
    log_config.console_thread_id = false;
    if (!cmd.log_file.empty()) {
        log_config.file_enabled = true;
        log_config.file_path = cmd.log_file;
    }
    try {
        slp::init_logging(log_config);
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    int rc = 0;
    try {
        switch (cmd.command) {
            case slp::CommandKind::RUN: rc = run_simulation(cmd); break;
            case slp::CommandKind::REPORT: rc = print_report(cmd); break;
            case slp::CommandKind::EXPLAIN: std::cout << slp::explain_protection(); break;
            case slp::CommandKind::HELP: std::cout << slp::usage(argv[0]); break;
        }
    } catch (const std::exception& e) {
        slp::log::core.fatal() << e.what();
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    slp::shutdown_logging();
    return rc;
}
