#pragma once

#include "core/logging.hh"
#include "simulation/config.hh"
#include <string>
#include <vector>

namespace slp {

// ============================================================================
// Command Line
// ============================================================================

enum class CommandKind : std::uint8_t {
    RUN,
    REPORT,
    EXPLAIN,
    HELP,
};

struct CommandLine {
    CommandKind command = CommandKind::HELP;
    SimulationConfig config;
    std::string results_file;
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;

    // Non-empty when parsing failed
    std::string error;

    [[nodiscard]] bool ok() const { return error.empty(); }
};

// args excludes the program name
[[nodiscard]] CommandLine parse_command_line(const std::vector<std::string>& args);

[[nodiscard]] std::string usage(std::string_view program);

}  // namespace slp
