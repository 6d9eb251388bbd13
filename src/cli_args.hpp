#ifndef STARCAST_CLI_ARGS_HPP
#define STARCAST_CLI_ARGS_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "config_parser.hpp"

namespace starcast {

// Command-line options; unset options leave the config file's values alone
struct CLIArgs {
    std::string config_path;
    std::optional<std::string> panel_path;
    std::optional<std::string> thresholds_path;
    std::optional<size_t> threshold_preamble;
    std::optional<std::string> weights_path;
    std::optional<std::string> values_path;
    std::optional<std::string> scenarios_path;
    std::optional<std::string> organization_id;
    std::optional<int> year;
    std::optional<size_t> num_draws;
    std::optional<uint64_t> seed;
    std::optional<double> target;
    std::optional<double> cost_per_point;
    std::optional<double> time_budget_ms;
    std::optional<std::string> log_level;
    std::optional<std::string> output_path;
    bool store_draws = false;
    bool help = false;
};

void print_usage(std::ostream& os, const char* program_name);

// Returns false on an unknown option, a missing value or a value that does
// not parse; the reason is written to `err`
bool parse_args(int argc, const char* const argv[], CLIArgs& args, std::ostream& err);

// Command-line values take precedence over the config file.
// Throws ConfigParseError for an unknown log level.
void apply_overrides(const CLIArgs& args, AnalysisConfig& config);

} // namespace starcast

#endif // STARCAST_CLI_ARGS_HPP
