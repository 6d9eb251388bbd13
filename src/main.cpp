#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "cli_args.hpp"
#include "config_parser.hpp"
#include "improvement_path.hpp"
#include "logger.hpp"
#include "measure_panel.hpp"
#include "model_fitting.hpp"
#include "scenario.hpp"
#include "simulation.hpp"
#include "star_rating.hpp"
#include "thresholds.hpp"
#include "valuation.hpp"
#include "io/json_writer.hpp"

namespace {

std::atomic<bool> g_interrupted(false);

void handle_interrupt(int) {
    g_interrupted.store(true);
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool validate_inputs(const starcast::AnalysisConfig& config) {
    bool valid = true;
    const std::vector<std::pair<std::string, std::string>> files = {
        {"Panel", config.inputs.panel},
        {"Thresholds", config.inputs.thresholds},
        {"Weights", config.inputs.weights},
        {"Rating values", config.inputs.rating_values},
        {"Scenarios", config.inputs.scenarios},
    };
    for (const auto& [label, path] : files) {
        if (!path.empty() && !file_exists(path)) {
            std::cerr << "Error: " << label << " file not found: " << path << "\n";
            valid = false;
        }
    }
    return valid;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    starcast::CLIArgs args;

    // Parse arguments
    if (!starcast::parse_args(argc, argv, args, std::cerr)) {
        starcast::print_usage(std::cerr, argv[0]);
        return 1;
    }

    // Handle help
    if (args.help || argc == 1) {
        starcast::print_usage(std::cerr, argv[0]);
        return 0;
    }

    starcast::AnalysisConfig config;
    try {
        if (!args.config_path.empty()) {
            config = starcast::parse_analysis_config_from_file(args.config_path);
        }
        starcast::apply_overrides(args, config);
        starcast::validate_analysis_config(config);
    } catch (const starcast::ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n\nUse --help for usage information.\n";
        return 1;
    }

    if (!validate_inputs(config)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    starcast::Logger& logger = starcast::Logger::get_instance();
    logger.configure(config.logging);
    std::signal(SIGINT, handle_interrupt);

    const std::string& org = config.organization_id;
    const int year = config.year;

    try {
        // Load panel (CSV or Parquet) and derive trend features
        starcast::LogContext load_ctx(org, year, "load");
        starcast::MeasurePanel panel = ends_with(config.inputs.panel, ".parquet")
            ? starcast::MeasurePanel::load_from_parquet(config.inputs.panel)
            : starcast::MeasurePanel::load_from_csv(config.inputs.panel, true, config.measure_prefix);

        std::vector<std::string> measure_keys;
        for (const auto& key : panel.measure_keys()) {
            if (config.measure_prefix.empty() || key.rfind(config.measure_prefix, 0) == 0) {
                measure_keys.push_back(key);
            }
        }
        panel.derive_trend_features(measure_keys);
        logger.log_info(load_ctx, "Loaded panel with " + std::to_string(panel.size()) + " rows and " +
                                  std::to_string(measure_keys.size()) + " measures");

        starcast::ThresholdSet thresholds = starcast::ThresholdSet::load_from_csv(
            config.inputs.thresholds, config.inputs.threshold_preamble_rows);
        logger.log_info(load_ctx, "Loaded thresholds for " + std::to_string(thresholds.size()) + " measures");

        starcast::MeasureWeights weights = config.inputs.weights.empty()
            ? config.weights
            : starcast::MeasureWeights::load_from_csv(config.inputs.weights);

        starcast::RatingValueTable values = config.inputs.rating_values.empty()
            ? config.rating_values
            : starcast::RatingValueTable::load_from_csv(config.inputs.rating_values);

        // Fails before any fitting when the organization-year is absent
        const starcast::ObservationRow& row = panel.get(org, year);

        // Current ratings from observed scores
        starcast::RatingSnapshot current = starcast::rate_row(row.values, thresholds, weights);

        // Fit distribution models
        starcast::FitReport fit = starcast::fit_models(panel, measure_keys, config.fitting);
        logger.log_info(starcast::LogContext(org, year, "fit"),
                        "Fitted " + std::to_string(fit.models.size()) + " models, skipped " +
                        std::to_string(fit.skipped.size()) + ", failed " +
                        std::to_string(fit.failures.size()));

        // Baseline simulation
        starcast::SimulationConfig sim_config = config.simulation;
        sim_config.cancel = &g_interrupted;
        starcast::SimulationResult baseline =
            starcast::run_simulation(row, fit.models, thresholds, weights, sim_config);

        // Improvement path from the observed composite
        std::optional<starcast::ImprovementPath> path;
        if (current.aggregate) {
            std::optional<double> target = config.target_rating
                ? config.target_rating
                : starcast::next_rating_cutoff(*current.aggregate);
            if (target) {
                path = starcast::compute_improvement_path(current.ratings, current.distances, weights,
                                                          *current.aggregate, *target);
            } else {
                logger.log_info(starcast::LogContext(org, year, "path"),
                                "Composite rating is above the last cutoff; no improvement path");
            }
        } else {
            logger.log_warning(starcast::LogContext(org, year, "path"),
                               "Composite rating is undefined; no improvement path");
        }

        // Strategy ranking
        std::optional<starcast::StrategyReport> strategies;
        starcast::LogContext strategy_ctx(org, year, "strategy");
        if (values.empty()) {
            logger.log_warning(strategy_ctx, "No rating values configured; strategy ranking skipped");
        } else if (g_interrupted.load()) {
            logger.log_warning(strategy_ctx, "Interrupted; strategy ranking skipped");
        } else {
            starcast::ScenarioSet scenarios;
            if (!config.inputs.scenarios.empty()) {
                scenarios = starcast::ScenarioSet::load_from_csv(config.inputs.scenarios);
            } else if (config.generate_scenarios) {
                scenarios = starcast::ScenarioSet::generate_candidates(
                    fit.models, weights, config.scenario_step, config.high_weight_threshold);
            }
            if (!scenarios.empty()) {
                strategies = starcast::evaluate_strategies(panel, fit.models, thresholds, weights,
                                                           org, year, scenarios, values,
                                                           config.cost_per_point, sim_config);
            }
        }

        // Write JSON output
        starcast::io::AnalysisDocument doc;
        doc.organization_id = org;
        doc.year = year;
        doc.current = &current;
        doc.fit = &fit;
        doc.simulation = &baseline;
        doc.path = path ? &*path : nullptr;
        doc.strategies = strategies ? &*strategies : nullptr;
        doc.include_draws = config.simulation.store_draws;

        if (config.output_path.empty()) {
            starcast::io::write_analysis_json(std::cout, doc);
        } else {
            starcast::io::write_analysis_json(config.output_path, doc);
            logger.log_info(starcast::LogContext(org, year, "output"),
                            "Output written to: " + config.output_path);
        }

        logger.flush();
        return baseline.cancelled ? 2 : 0;
    } catch (const std::exception& e) {
        logger.log_error(starcast::LogContext(org, year, "run"), e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
