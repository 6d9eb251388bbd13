#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <memory>
#include <sstream>
#include "scenario.hpp"

using namespace starcast;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

class FixedGenerator : public DrawGenerator {
public:
    explicit FixedGenerator(double value) : value_(value) {}
    double draw(std::mt19937_64&) const override { return value_; }
    double mean() const override { return value_; }

private:
    double value_;
};

class FixedModel : public DistributionModel {
public:
    FixedModel(std::string target, double value) : target_(std::move(target)), value_(value) {}

    const std::string& target() const override { return target_; }
    const std::vector<std::string>& feature_names() const override { return names_; }
    size_t observation_count() const override { return 20; }

    using DistributionModel::conditional;
    std::unique_ptr<DrawGenerator> conditional(const std::vector<double>&) const override {
        return std::make_unique<FixedGenerator>(value_);
    }

private:
    std::string target_;
    std::vector<std::string> names_;
    double value_;
};

ThresholdTable even_table(const std::string& measure) {
    return ThresholdTable(measure, {{0.0, 20.0, 1}, {20.0, 40.0, 2}, {40.0, 60.0, 3},
                                    {60.0, 80.0, 4}, {80.0, 101.0, 5}});
}

// A and B both sit at 50, 10 points below the level-4 band
struct StrategyFixture {
    MeasurePanel panel;
    ModelMap models;
    ThresholdSet thresholds;
    MeasureWeights weights{{"A", 1.0}, {"B", 1.0}};
    RatingValueTable values{{3, 100000.0}, {4, 300000.0}, {5, 600000.0}};
    SimulationConfig config;

    StrategyFixture() {
        ObservationRow row("H1", 2024);
        row.values["A"] = 50.0;
        row.values["B"] = 50.0;
        panel.add(row);

        models["A"] = std::make_shared<FixedModel>("A", 0.5);
        models["B"] = std::make_shared<FixedModel>("B", 0.5);

        thresholds.add(even_table("A"));
        thresholds.add(even_table("B"));

        config.n_draws = 40;
    }
};

} // anonymous namespace

// ============================================================================
// ImprovementScenario / ScenarioSet
// ============================================================================

TEST_CASE("ImprovementScenario totals its points", "[scenario]") {
    ImprovementScenario scenario("Push screening", {{"A", 2.0}, {"B", 3.5}});

    REQUIRE(scenario.name == "Push screening");
    REQUIRE_THAT(scenario.total_points(), WithinRel(5.5, 1e-12));
    REQUIRE(ImprovementScenario().total_points() == 0.0);
}

TEST_CASE("ScenarioSet add and get", "[scenario]") {
    ScenarioSet set;
    REQUIRE(set.empty());

    set.add(ImprovementScenario("one", {{"A", 1.0}}));
    ImprovementScenario two("two", {{"B", 2.0}});
    set.add(two);

    REQUIRE(set.size() == 2);
    REQUIRE(set.get(1).name == "two");
    REQUIRE_THROWS_AS(set.get(2), std::out_of_range);

    set.clear();
    REQUIRE(set.empty());
}

TEST_CASE("ScenarioSet generates single-measure and combined candidates", "[scenario]") {
    ModelMap models;
    models["A"] = std::make_shared<FixedModel>("A", 0.5);
    models["B"] = std::make_shared<FixedModel>("B", 0.5);
    MeasureWeights weights{{"A", 3.0}, {"B", 1.0}, {"C", 5.0}};

    auto set = ScenarioSet::generate_candidates(models, weights);

    REQUIRE(set.size() == 3);
    REQUIRE(set.get(0).name == "Improve A by 1 point");
    REQUIRE(set.get(1).name == "Improve B by 1 point");
    REQUIRE(set.get(2).name == "Improve all high-weight measures by 1 point");

    // C is heavy but unmodeled, so only A joins the combined scenario
    REQUIRE(set.get(2).adjustments.size() == 1);
    REQUIRE(set.get(2).adjustments.at("A") == 1.0);
}

TEST_CASE("ScenarioSet candidates honour the step size", "[scenario]") {
    ModelMap models;
    models["A"] = std::make_shared<FixedModel>("A", 0.5);
    MeasureWeights weights{{"A", 1.0}};

    auto set = ScenarioSet::generate_candidates(models, weights, 2.5);

    // No measure meets the high-weight threshold
    REQUIRE(set.size() == 1);
    REQUIRE(set.get(0).name == "Improve A by 2.5 points");
    REQUIRE(set.get(0).adjustments.at("A") == 2.5);
}

TEST_CASE("ScenarioSet loads long-format CSV", "[scenario][csv]") {
    std::istringstream is(
        "scenario,measure,points\n"
        "Outreach,C01: Screening,2\n"
        "Pharmacy,D12: Adherence,1.5\n"
        "Outreach,C02: Eye Exam,3\n"
        "Outreach,C01: Screening,1\n");
    auto set = ScenarioSet::load_from_csv(is);

    REQUIRE(set.size() == 2);
    REQUIRE(set.get(0).name == "Outreach");
    REQUIRE(set.get(1).name == "Pharmacy");

    const auto& outreach = set.get(0).adjustments;
    REQUIRE(outreach.size() == 2);
    REQUIRE_THAT(outreach.at("C: Screening"), WithinRel(3.0, 1e-12));
    REQUIRE_THAT(outreach.at("C: Eye Exam"), WithinRel(3.0, 1e-12));
    REQUIRE_THAT(set.get(1).adjustments.at("D: Adherence"), WithinRel(1.5, 1e-12));
}

TEST_CASE("ScenarioSet CSV errors", "[scenario][csv][error]") {
    std::istringstream narrow("scenario,measure\nA,B\n");
    REQUIRE_THROWS_AS(ScenarioSet::load_from_csv(narrow), std::runtime_error);

    std::istringstream bad_points("scenario,measure,points\nA,B,lots\n");
    REQUIRE_THROWS_AS(ScenarioSet::load_from_csv(bad_points), std::runtime_error);

    REQUIRE_THROWS_AS(ScenarioSet::load_from_csv("/nonexistent/scenarios.csv"), std::runtime_error);
}

// ============================================================================
// Strategy Evaluation
// ============================================================================

TEST_CASE("evaluate_strategies ranks scenarios by ROI", "[scenario][strategy]") {
    StrategyFixture f;
    ScenarioSet scenarios;
    scenarios.add(ImprovementScenario("Lift B", {{"B", 15.0}}));
    scenarios.add(ImprovementScenario("Lift both", {{"A", 10.0}, {"B", 15.0}}));
    scenarios.add(ImprovementScenario("Lift A", {{"A", 10.0}}));

    auto report = evaluate_strategies(f.panel, f.models, f.thresholds, f.weights, "H1", 2024,
                                      scenarios, f.values, 10000.0, f.config);

    // Baseline: A level 3, B level 3
    REQUIRE_THAT(report.baseline.expected_rating, WithinRel(3.0, 1e-12));
    REQUIRE_THAT(report.baseline_value, WithinRel(100000.0, 1e-12));
    REQUIRE(report.results.size() == 3);
    REQUIRE(report.failures.empty());

    const auto& best = report.results[0];
    REQUIRE(best.scenario == "Lift both");
    REQUIRE_THAT(best.estimated_cost, WithinRel(250000.0, 1e-12));
    REQUIRE_THAT(best.roi, WithinRel(0.8, 1e-12));

    // A single lift gives a composite of 3.5, which still bins to level 3;
    // equal ROIs keep their input order
    REQUIRE(report.results[1].scenario == "Lift B");
    REQUIRE(report.results[2].scenario == "Lift A");
    REQUIRE_THAT(report.results[2].improved_rating, WithinRel(3.5, 1e-12));
    REQUIRE_THAT(report.results[2].rating_change, WithinRel(0.5, 1e-12));
    REQUIRE(report.results[2].value_change == 0.0);
    REQUIRE(report.results[2].roi == 0.0);
}

TEST_CASE("evaluate_strategies values a distribution shift", "[scenario][strategy]") {
    StrategyFixture f;
    ScenarioSet scenarios;
    scenarios.add(ImprovementScenario("Lift both", {{"A", 10.0}, {"B", 15.0}}));

    auto report = evaluate_strategies(f.panel, f.models, f.thresholds, f.weights, "H1", 2024,
                                      scenarios, f.values, 1000.0, f.config);

    REQUIRE(report.results.size() == 1);
    const auto& result = report.results[0];

    // Composite 4.0 bins to level 4: value moves from 100k to 300k
    REQUIRE_THAT(result.improved_rating, WithinRel(4.0, 1e-12));
    REQUIRE_THAT(result.value_change, WithinRel(200000.0, 1e-12));
    REQUIRE_THAT(result.estimated_cost, WithinRel(25000.0, 1e-12));
    REQUIRE_THAT(result.roi, WithinRel(8.0, 1e-12));
    REQUIRE_THAT(result.improved_distribution.probability(4), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(result.valuation.probability_change_for(3), WithinAbs(-1.0, 1e-12));
}

TEST_CASE("evaluate_strategies records failing scenarios and continues", "[scenario][strategy][error]") {
    StrategyFixture f;
    ScenarioSet scenarios;
    scenarios.add(ImprovementScenario("Cut corners", {{"A", -5.0}}));
    scenarios.add(ImprovementScenario("Lift A", {{"A", 10.0}}));

    auto report = evaluate_strategies(f.panel, f.models, f.thresholds, f.weights, "H1", 2024,
                                      scenarios, f.values, 10000.0, f.config);

    // Negative points imply a negative cost, which cannot be ranked
    REQUIRE(report.failures.size() == 1);
    REQUIRE(report.failures[0].scenario == "Cut corners");
    REQUIRE(report.results.size() == 1);
    REQUIRE(report.results[0].scenario == "Lift A");
}

TEST_CASE("evaluate_strategies treats a free scenario as infinite ROI", "[scenario][strategy][boundary]") {
    StrategyFixture f;
    ScenarioSet scenarios;
    scenarios.add(ImprovementScenario("Lift A", {{"A", 10.0}}));
    scenarios.add(ImprovementScenario("Nothing", {}));

    auto report = evaluate_strategies(f.panel, f.models, f.thresholds, f.weights, "H1", 2024,
                                      scenarios, f.values, 10000.0, f.config);

    REQUIRE(report.results.size() == 2);
    REQUIRE(report.results[0].scenario == "Nothing");
    REQUIRE(std::isinf(report.results[0].roi));
}

TEST_CASE("evaluate_strategies requires the organization-year", "[scenario][strategy][error]") {
    StrategyFixture f;
    ScenarioSet scenarios;

    REQUIRE_THROWS_AS(evaluate_strategies(f.panel, f.models, f.thresholds, f.weights, "H1", 2020,
                                          scenarios, f.values),
                      NoDataForContractYear);
}
