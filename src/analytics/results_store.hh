#pragma once

#include "simulation/orchestrator.hh"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace slp {

// ============================================================================
// Results Persistence
// ============================================================================
//
// u64/i64 amounts are written as decimal strings so lamport values survive
// readers that parse JSON numbers as doubles.

inline constexpr std::string_view RESULTS_FILE_NAME = "results.json";
inline constexpr std::string_view SUMMARY_FILE_NAME = "summary.txt";
inline constexpr int RESULTS_FORMAT_VERSION = 1;

[[nodiscard]] nlohmann::json results_to_json(const SimulationResults& results);

// Throws std::runtime_error on missing fields or malformed amounts
[[nodiscard]] SimulationResults results_from_json(const nlohmann::json& j);

// Plain-text report: summary, comparison and distributions
[[nodiscard]] std::string format_summary(const SimulationResults& results);

// Writes DIR/results.json and DIR/summary.txt, creating DIR if needed.
// Returns the results path. Throws std::runtime_error on I/O failure.
std::filesystem::path save_results(const SimulationResults& results, const std::filesystem::path& dir);

// Throws std::runtime_error when the file is unreadable or not valid results
[[nodiscard]] SimulationResults load_results(const std::filesystem::path& path);

}  // namespace slp
