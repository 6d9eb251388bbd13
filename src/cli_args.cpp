#include "cli_args.hpp"
#include <stdexcept>

namespace starcast {

void print_usage(std::ostream& os, const char* program_name) {
    os << "StarCast v1.0.0\n\n";
    os << "Usage: " << program_name << " [options]\n\n";
    os << "Configuration:\n";
    os << "  --config <path>             JSON analysis configuration; options below override it\n\n";
    os << "Data input options:\n";
    os << "  --panel <path>              CSV or Parquet measure panel (organization_id,year,<measures>)\n";
    os << "  --thresholds <path>         Cutpoint CSV with \"<n> star\" rows\n";
    os << "  --threshold-preamble <n>    Lines to skip before the cutpoint header (default: 0)\n";
    os << "  --weights <path>            CSV with columns measure,weight\n";
    os << "  --values <path>             CSV with columns rating,value\n";
    os << "  --scenarios <path>          CSV with columns scenario,measure,points\n";
    os << "                              (default: one candidate per modeled measure)\n\n";
    os << "Analysis options:\n";
    os << "  --contract <id>             Organization to analyze\n";
    os << "  --year <year>               Year to analyze\n";
    os << "  --draws <count>             Monte Carlo draws (default: 1000)\n";
    os << "  --seed <value>              Random seed for reproducibility (default: 42)\n";
    os << "  --target <rating>           Target composite rating (default: next cutoff)\n";
    os << "  --cost-per-point <amount>   Cost of one percentage point (default: 10000)\n";
    os << "  --time-budget-ms <ms>       Stop simulating after this long (default: no limit)\n";
    os << "  --store-draws               Include every draw in the output\n\n";
    os << "Output options:\n";
    os << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    os << "  --output <path>             JSON output file (default: stdout)\n\n";
    os << "Other options:\n";
    os << "  --help                      Show this help message\n\n";
    os << "Example:\n";
    os << "  " << program_name << " --panel data/panel.csv \\\n";
    os << "      --thresholds data/cutpoints.csv --threshold-preamble 1 \\\n";
    os << "      --weights data/weights.csv --values data/values.csv \\\n";
    os << "      --contract H1234 --year 2025 --draws 5000 --seed 7 \\\n";
    os << "      --output results.json\n";
}

namespace {

// std::stoul accepts "-1" and wraps it; counts must be written unsigned
size_t parse_count(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        throw std::invalid_argument("negative count");
    }
    size_t pos = 0;
    unsigned long long value = std::stoull(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return static_cast<size_t>(value);
}

double parse_real(const std::string& text) {
    size_t pos = 0;
    double value = std::stod(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return value;
}

int parse_int(const std::string& text) {
    size_t pos = 0;
    int value = std::stoi(text, &pos);
    if (pos != text.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return value;
}

} // anonymous namespace

bool parse_args(int argc, const char* const argv[], CLIArgs& args, std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--panel" && i + 1 < argc) {
                args.panel_path = argv[++i];
            } else if (arg == "--thresholds" && i + 1 < argc) {
                args.thresholds_path = argv[++i];
            } else if (arg == "--threshold-preamble" && i + 1 < argc) {
                args.threshold_preamble = parse_count(argv[++i]);
            } else if (arg == "--weights" && i + 1 < argc) {
                args.weights_path = argv[++i];
            } else if (arg == "--values" && i + 1 < argc) {
                args.values_path = argv[++i];
            } else if (arg == "--scenarios" && i + 1 < argc) {
                args.scenarios_path = argv[++i];
            } else if (arg == "--contract" && i + 1 < argc) {
                args.organization_id = argv[++i];
            } else if (arg == "--year" && i + 1 < argc) {
                args.year = parse_int(argv[++i]);
            } else if (arg == "--draws" && i + 1 < argc) {
                args.num_draws = parse_count(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = static_cast<uint64_t>(parse_count(argv[++i]));
            } else if (arg == "--target" && i + 1 < argc) {
                args.target = parse_real(argv[++i]);
            } else if (arg == "--cost-per-point" && i + 1 < argc) {
                args.cost_per_point = parse_real(argv[++i]);
            } else if (arg == "--time-budget-ms" && i + 1 < argc) {
                args.time_budget_ms = parse_real(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--store-draws") {
                args.store_draws = true;
            } else {
                err << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::exception&) {
            err << "Error: Invalid value for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

void apply_overrides(const CLIArgs& args, AnalysisConfig& config) {
    if (args.panel_path) config.inputs.panel = *args.panel_path;
    if (args.thresholds_path) config.inputs.thresholds = *args.thresholds_path;
    if (args.threshold_preamble) config.inputs.threshold_preamble_rows = *args.threshold_preamble;
    if (args.weights_path) config.inputs.weights = *args.weights_path;
    if (args.values_path) config.inputs.rating_values = *args.values_path;
    if (args.scenarios_path) config.inputs.scenarios = *args.scenarios_path;
    if (args.organization_id) config.organization_id = *args.organization_id;
    if (args.year) config.year = *args.year;
    if (args.num_draws) config.simulation.n_draws = *args.num_draws;
    if (args.seed) config.simulation.seed = *args.seed;
    if (args.target) config.target_rating = *args.target;
    if (args.cost_per_point) config.cost_per_point = *args.cost_per_point;
    if (args.time_budget_ms) config.simulation.time_budget_ms = *args.time_budget_ms;
    if (args.log_level) {
        const std::string& level = *args.log_level;
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("--log-level must be DEBUG, INFO, WARN or ERROR");
        }
        config.logging.min_level = string_to_level(level);
    }
    if (args.output_path) config.output_path = *args.output_path;
    if (args.store_draws) config.simulation.store_draws = true;
}

} // namespace starcast
