#ifndef STARCAST_CONFIG_PARSER_HPP
#define STARCAST_CONFIG_PARSER_HPP

#include "distribution_model.hpp"
#include "logger.hpp"
#include "simulation.hpp"
#include "star_rating.hpp"
#include "valuation.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace starcast {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input file locations for an analysis run
 *
 * Weights and rating values may instead be given inline in the config,
 * in which case the corresponding path stays empty.
 */
struct InputPaths {
    std::string panel;                  ///< Measure panel (.csv or .parquet)
    std::string thresholds;             ///< Cutpoint CSV
    size_t threshold_preamble_rows;     ///< Lines before the cutpoint header
    std::string weights;                ///< measure,weight CSV
    std::string rating_values;          ///< rating,value CSV
    std::string scenarios;              ///< scenario,measure,points CSV (optional)

    InputPaths() : threshold_preamble_rows(0) {}
};

/**
 * @brief Complete configuration of one forecast/valuation run
 */
struct AnalysisConfig {
    std::string description;
    InputPaths inputs;

    MeasureWeights weights;             ///< Inline weights (empty if loaded from file)
    RatingValueTable rating_values;     ///< Inline values (empty if loaded from file)

    std::string organization_id;
    int year;
    std::optional<double> target_rating;    ///< Defaults to the next composite cutoff
    double cost_per_point;
    std::string measure_prefix;             ///< Restrict panel columns (e.g. "C:")

    SimulationConfig simulation;
    FitConfig fitting;

    bool generate_scenarios;
    double scenario_step;
    double high_weight_threshold;

    LoggerConfig logging;
    std::string output_path;            ///< Result JSON; empty writes to stdout

    AnalysisConfig();
};

/**
 * @brief Parses an analysis configuration from a JSON file
 *
 * Relative input and output paths are resolved against the directory
 * containing the config file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 */
AnalysisConfig parse_analysis_config_from_file(const std::string& file_path);

/**
 * @brief Parses an analysis configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if JSON is invalid or a value is out of range
 */
AnalysisConfig parse_analysis_config_from_string(const std::string& json_string);

/**
 * @brief Checks that a configuration is complete enough to run
 *
 * @throws ConfigParseError naming the first missing or invalid setting
 */
void validate_analysis_config(const AnalysisConfig& config);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * If path is relative, makes it relative to the directory containing the config file.
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace starcast

#endif // STARCAST_CONFIG_PARSER_HPP
