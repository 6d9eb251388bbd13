#include "config_parser.hpp"
#include "thresholds.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace starcast {

AnalysisConfig::AnalysisConfig()
    : description(""),
      organization_id(""),
      year(0),
      cost_per_point(10000.0),
      measure_prefix(""),
      generate_scenarios(true),
      scenario_step(1.0),
      high_weight_threshold(3.0),
      output_path("") {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty() || (braces && (pos >= result.size() || result[pos] != '}'))) {
            // Not a variable reference; keep the text
            pos = start + 1;
            continue;
        }
        if (braces) {
            pos++; // Skip '}'
        }

        // Get environment variable value
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        // Replace in string
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    // Resolve relative to config directory
    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

namespace {

std::string get_path(const json& j, const char* key) {
    if (!j.contains(key)) {
        return "";
    }
    return expand_environment_variables(j[key].get<std::string>());
}

void parse_inputs(const json& j, AnalysisConfig& config) {
    config.inputs.panel = get_path(j, "panel");
    config.inputs.thresholds = get_path(j, "thresholds");
    config.inputs.scenarios = get_path(j, "scenarios");
    config.inputs.threshold_preamble_rows = j.value("threshold_preamble_rows", static_cast<size_t>(0));

    // Weights: path or inline object
    if (j.contains("weights")) {
        const json& w = j["weights"];
        if (w.is_string()) {
            config.inputs.weights = expand_environment_variables(w.get<std::string>());
        } else if (w.is_object()) {
            for (auto it = w.begin(); it != w.end(); ++it) {
                config.weights.set(normalize_measure_key(it.key()), it.value().get<double>());
            }
        } else {
            throw ConfigParseError("inputs.weights must be a path or an object");
        }
    }

    // Rating values: path or inline object keyed by level
    if (j.contains("rating_values")) {
        const json& v = j["rating_values"];
        if (v.is_string()) {
            config.inputs.rating_values = expand_environment_variables(v.get<std::string>());
        } else if (v.is_object()) {
            for (auto it = v.begin(); it != v.end(); ++it) {
                double parsed = 0.0;
                try {
                    parsed = std::stod(it.key());
                } catch (const std::exception&) {
                    throw ConfigParseError("Invalid rating level in rating_values: " + it.key());
                }
                int level = static_cast<int>(parsed);
                if (static_cast<double>(level) != parsed) {
                    throw ConfigParseError("Rating level must be a whole number: " + it.key());
                }
                config.rating_values.set(level, it.value().get<double>());
            }
        } else {
            throw ConfigParseError("inputs.rating_values must be a path or an object");
        }
    }
}

void parse_simulation(const json& j, SimulationConfig& sim) {
    if (j.contains("n_draws")) {
        long long draws = j["n_draws"].get<long long>();
        if (draws <= 0) {
            throw ConfigParseError("simulation.n_draws must be positive");
        }
        sim.n_draws = static_cast<size_t>(draws);
    }
    sim.seed = j.value("seed", sim.seed);
    sim.store_draws = j.value("store_draws", sim.store_draws);
    sim.time_budget_ms = j.value("time_budget_ms", sim.time_budget_ms);
    if (sim.time_budget_ms < 0.0) {
        throw ConfigParseError("simulation.time_budget_ms must be non-negative");
    }
}

void parse_fitting(const json& j, FitConfig& fit) {
    fit.min_observations = j.value("min_observations", fit.min_observations);
    fit.boundary_epsilon = j.value("boundary_epsilon", fit.boundary_epsilon);
    fit.max_iterations = j.value("max_iterations", fit.max_iterations);
    fit.tolerance = j.value("tolerance", fit.tolerance);
    fit.ridge_penalty = j.value("ridge_penalty", fit.ridge_penalty);

    if (!(fit.boundary_epsilon > 0.0 && fit.boundary_epsilon < 0.5)) {
        throw ConfigParseError("fitting.boundary_epsilon must be in (0, 0.5)");
    }
    if (fit.max_iterations <= 0) {
        throw ConfigParseError("fitting.max_iterations must be positive");
    }
    if (fit.ridge_penalty < 0.0) {
        throw ConfigParseError("fitting.ridge_penalty must be non-negative");
    }
}

void parse_logging(const json& j, LoggerConfig& logging) {
    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("logging.level must be DEBUG, INFO, WARN or ERROR");
        }
        logging.min_level = string_to_level(level);
    }
    logging.enable_json = j.value("json", logging.enable_json);
    logging.enable_console = j.value("console", logging.enable_console);
    if (j.contains("file")) {
        logging.enable_file = true;
        logging.log_file_path = expand_environment_variables(j["file"].get<std::string>());
    }
    logging.max_sampling_warnings = j.value("max_sampling_warnings", logging.max_sampling_warnings);
}

} // anonymous namespace

AnalysisConfig parse_analysis_config_from_string(const std::string& json_string) {
    AnalysisConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("description")) {
            config.description = j["description"].get<std::string>();
        }

        if (j.contains("inputs")) {
            parse_inputs(j["inputs"], config);
        }

        if (j.contains("analysis")) {
            const json& a = j["analysis"];
            if (a.contains("organization_id")) {
                config.organization_id = expand_environment_variables(a["organization_id"].get<std::string>());
            }
            config.year = a.value("year", config.year);
            if (a.contains("target_rating")) {
                config.target_rating = a["target_rating"].get<double>();
            }
            config.cost_per_point = a.value("cost_per_point", config.cost_per_point);
            config.measure_prefix = a.value("measure_prefix", config.measure_prefix);
        }

        if (j.contains("simulation")) {
            parse_simulation(j["simulation"], config.simulation);
        }

        if (j.contains("fitting")) {
            parse_fitting(j["fitting"], config.fitting);
        }

        if (j.contains("scenarios")) {
            const json& s = j["scenarios"];
            config.generate_scenarios = s.value("generate", config.generate_scenarios);
            config.scenario_step = s.value("step", config.scenario_step);
            config.high_weight_threshold = s.value("high_weight_threshold", config.high_weight_threshold);
        }

        if (j.contains("logging")) {
            parse_logging(j["logging"], config.logging);
        }

        if (j.contains("output")) {
            config.output_path = get_path(j["output"], "path");
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(std::string("Invalid value: ") + e.what());
    }

    if (config.cost_per_point < 0.0) {
        throw ConfigParseError("analysis.cost_per_point must be non-negative");
    }

    return config;
}

AnalysisConfig parse_analysis_config_from_file(const std::string& file_path) {
    // Read file
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    AnalysisConfig config = parse_analysis_config_from_string(buffer.str());

    // Resolve relative paths
    config.inputs.panel = resolve_relative_path(config.inputs.panel, file_path);
    config.inputs.thresholds = resolve_relative_path(config.inputs.thresholds, file_path);
    config.inputs.weights = resolve_relative_path(config.inputs.weights, file_path);
    config.inputs.rating_values = resolve_relative_path(config.inputs.rating_values, file_path);
    config.inputs.scenarios = resolve_relative_path(config.inputs.scenarios, file_path);
    config.output_path = resolve_relative_path(config.output_path, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

void validate_analysis_config(const AnalysisConfig& config) {
    if (config.inputs.panel.empty()) {
        throw ConfigParseError("Missing required setting: panel");
    }
    if (config.inputs.thresholds.empty()) {
        throw ConfigParseError("Missing required setting: thresholds");
    }
    if (config.inputs.weights.empty() && config.weights.empty()) {
        throw ConfigParseError("Missing required setting: weights");
    }
    if (config.organization_id.empty()) {
        throw ConfigParseError("Missing required setting: organization_id");
    }
    if (config.year <= 0) {
        throw ConfigParseError("Missing required setting: year");
    }
    if (config.simulation.n_draws == 0) {
        throw ConfigParseError("n_draws must be positive");
    }
    if (config.cost_per_point < 0.0) {
        throw ConfigParseError("cost_per_point must be non-negative");
    }
}

} // namespace starcast
