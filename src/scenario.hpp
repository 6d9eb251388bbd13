#ifndef STARCAST_SCENARIO_HPP
#define STARCAST_SCENARIO_HPP

#include "model_fitting.hpp"
#include "simulation.hpp"
#include "valuation.hpp"
#include <istream>
#include <string>
#include <vector>

namespace starcast {

// ImprovementScenario: a named set of fixed percentage-point changes
struct ImprovementScenario {
    std::string name;
    Adjustments adjustments;

    ImprovementScenario();
    ImprovementScenario(std::string n, Adjustments adj);

    // Sum of adjustment points (the cost basis)
    double total_points() const;
};

// ScenarioSet: candidate interventions evaluated against one baseline
class ScenarioSet {
public:
    ScenarioSet();

    void add(const ImprovementScenario& scenario);
    void add(ImprovementScenario&& scenario);

    // Throws std::out_of_range
    const ImprovementScenario& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<ImprovementScenario>& scenarios() const { return scenarios_; }

    void reserve(size_t count);
    void clear();

    // One scenario per modeled measure ("Improve <m> by <step> points"), plus
    // one combined scenario over every modeled measure whose weight is at
    // least `high_weight_threshold`
    static ScenarioSet generate_candidates(const ModelMap& models,
                                           const MeasureWeights& weights,
                                           double step = 1.0,
                                           double high_weight_threshold = 3.0);

    // Load from CSV in long format: scenario,measure,points
    // Rows sharing a scenario name are merged; scenario order follows first
    // appearance.
    static ScenarioSet load_from_csv(const std::string& filepath, bool normalize_keys = true);
    static ScenarioSet load_from_csv(std::istream& is, bool normalize_keys = true);

private:
    std::vector<ImprovementScenario> scenarios_;
};

struct StrategyResult {
    std::string scenario;
    Adjustments adjustments;
    double baseline_rating;
    double improved_rating;
    double rating_change;
    double value_change;
    double estimated_cost;
    double roi;                     // +inf when the scenario costs nothing
    ValuationResult valuation;
    RatingDistribution improved_distribution;

    StrategyResult();
};

struct StrategyFailure {
    std::string scenario;
    std::string message;
};

struct StrategyReport {
    SimulationResult baseline;
    double baseline_value;
    std::vector<StrategyResult> results;    // Sorted by ROI, highest first
    std::vector<StrategyFailure> failures;

    StrategyReport();
};

// Simulate the baseline once, then each scenario with the same seed, value
// the difference and rank by ROI. A failing scenario is recorded and the
// batch continues. Throws NoDataForContractYear when the row is absent.
StrategyReport evaluate_strategies(const MeasurePanel& panel,
                                   const ModelMap& models,
                                   const ThresholdSet& thresholds,
                                   const MeasureWeights& weights,
                                   const std::string& organization_id,
                                   int year,
                                   const ScenarioSet& scenarios,
                                   const RatingValueTable& values,
                                   double cost_per_point = 10000.0,
                                   const SimulationConfig& config = SimulationConfig());

} // namespace starcast

#endif // STARCAST_SCENARIO_HPP
