#include "scenario.hpp"
#include "logger.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace starcast {

// ============================================================================
// ImprovementScenario Implementation
// ============================================================================

ImprovementScenario::ImprovementScenario() : name("") {}

ImprovementScenario::ImprovementScenario(std::string n, Adjustments adj)
    : name(std::move(n)), adjustments(std::move(adj)) {}

double ImprovementScenario::total_points() const {
    double total = 0.0;
    for (const auto& [measure, points] : adjustments) {
        total += points;
    }
    return total;
}

// ============================================================================
// ScenarioSet Implementation
// ============================================================================

ScenarioSet::ScenarioSet() {}

void ScenarioSet::add(const ImprovementScenario& scenario) {
    scenarios_.push_back(scenario);
}

void ScenarioSet::add(ImprovementScenario&& scenario) {
    scenarios_.push_back(std::move(scenario));
}

const ImprovementScenario& ScenarioSet::get(size_t index) const {
    if (index >= scenarios_.size()) {
        throw std::out_of_range("Scenario index " + std::to_string(index) + " out of range");
    }
    return scenarios_[index];
}

size_t ScenarioSet::size() const {
    return scenarios_.size();
}

bool ScenarioSet::empty() const {
    return scenarios_.empty();
}

void ScenarioSet::reserve(size_t count) {
    scenarios_.reserve(count);
}

void ScenarioSet::clear() {
    scenarios_.clear();
}

namespace {

std::string points_label(double step) {
    std::ostringstream oss;
    oss << step << (step == 1.0 ? " point" : " points");
    return oss.str();
}

} // anonymous namespace

ScenarioSet ScenarioSet::generate_candidates(const ModelMap& models,
                                             const MeasureWeights& weights,
                                             double step,
                                             double high_weight_threshold) {
    ScenarioSet set;
    const std::string label = points_label(step);

    // Individual measure improvements
    for (const auto& [measure, model] : models) {
        set.add(ImprovementScenario("Improve " + measure + " by " + label, {{measure, step}}));
    }

    // Combined improvement of high-weight measures
    Adjustments combined;
    for (const auto& [measure, weight] : weights.weights()) {
        if (weight >= high_weight_threshold && models.find(measure) != models.end()) {
            combined[measure] = step;
        }
    }
    if (!combined.empty()) {
        set.add(ImprovementScenario("Improve all high-weight measures by " + label, std::move(combined)));
    }

    return set;
}

ScenarioSet ScenarioSet::load_from_csv(const std::string& filepath, bool normalize_keys) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file, normalize_keys);
}

ScenarioSet ScenarioSet::load_from_csv(std::istream& is, bool normalize_keys) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        throw std::runtime_error("Empty CSV file");
    }
    if (header.size() < 3) {
        throw std::runtime_error("Scenario CSV requires columns: scenario,measure,points");
    }

    ScenarioSet set;
    std::map<std::string, size_t> index_by_name;

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;
        if (row.size() < 3) {
            throw std::runtime_error("Scenario CSV row " + std::to_string(reader.rows_read()) +
                                     " has fewer than 3 columns");
        }

        auto points = CsvReader::parse_number(row[2]);
        if (!points) {
            throw std::runtime_error("Non-numeric points for scenario " + row[0] + ": " + row[2]);
        }

        auto it = index_by_name.find(row[0]);
        if (it == index_by_name.end()) {
            it = index_by_name.emplace(row[0], set.size()).first;
            set.add(ImprovementScenario(row[0], Adjustments()));
        }

        std::string measure = normalize_keys ? normalize_measure_key(row[1]) : row[1];
        set.scenarios_[it->second].adjustments[measure] += *points;
    }

    return set;
}

// ============================================================================
// Strategy evaluation
// ============================================================================

StrategyResult::StrategyResult()
    : scenario(""),
      baseline_rating(0.0),
      improved_rating(0.0),
      rating_change(0.0),
      value_change(0.0),
      estimated_cost(0.0),
      roi(0.0) {}

StrategyReport::StrategyReport() : baseline_value(0.0) {}

StrategyReport evaluate_strategies(const MeasurePanel& panel,
                                   const ModelMap& models,
                                   const ThresholdSet& thresholds,
                                   const MeasureWeights& weights,
                                   const std::string& organization_id,
                                   int year,
                                   const ScenarioSet& scenarios,
                                   const RatingValueTable& values,
                                   double cost_per_point,
                                   const SimulationConfig& config) {
    const ObservationRow& row = panel.get(organization_id, year);
    LogContext ctx(organization_id, year, "strategy");

    StrategyReport report;
    report.baseline = run_simulation(row, models, thresholds, weights, config);
    report.baseline_value = expected_value(report.baseline.distribution, values);

    for (const auto& scenario : scenarios.scenarios()) {
        try {
            SimulationResult improved = run_simulation(row, models, thresholds, weights, config,
                                                       scenario.adjustments);

            StrategyResult result;
            result.scenario = scenario.name;
            result.adjustments = scenario.adjustments;
            result.baseline_rating = report.baseline.expected_rating;
            result.improved_rating = improved.expected_rating;
            result.rating_change = improved.expected_rating - report.baseline.expected_rating;
            result.valuation = valuate(report.baseline.distribution, improved.distribution, values);
            result.value_change = result.valuation.net_change;
            result.estimated_cost = scenario.total_points() * cost_per_point;
            result.roi = compute_roi(result.value_change, result.estimated_cost);
            result.improved_distribution = improved.distribution;

            report.results.push_back(std::move(result));
        } catch (const std::exception& e) {
            report.failures.push_back({scenario.name, e.what()});
            Logger::get_instance().log_warning(ctx, "Scenario '" + scenario.name + "' failed: " + e.what());
        }
    }

    std::stable_sort(report.results.begin(), report.results.end(),
                     [](const StrategyResult& a, const StrategyResult& b) { return a.roi > b.roi; });

    return report;
}

} // namespace starcast
