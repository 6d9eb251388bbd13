#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "improvement_path.hpp"

using namespace starcast;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Next Cutoff
// ============================================================================

TEST_CASE("next_rating_cutoff finds the next half-star boundary", "[path]") {
    REQUIRE(*next_rating_cutoff(2.0) == 2.75);
    REQUIRE(*next_rating_cutoff(2.75) == 3.25);
    REQUIRE(*next_rating_cutoff(3.6) == 3.75);
    REQUIRE(*next_rating_cutoff(4.5) == 4.75);
    REQUIRE_FALSE(next_rating_cutoff(4.75).has_value());
    REQUIRE_FALSE(next_rating_cutoff(5.0).has_value());
}

// ============================================================================
// Improvement Path
// ============================================================================

TEST_CASE("A single eligible measure reaching the target", "[path]") {
    RatingMap ratings{{"A", 3}};
    DistanceMap distances{{"A", 0.02}};
    MeasureWeights weights{{"A", 1.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 3.0, 4.0);

    REQUIRE(path.steps.size() == 1);
    REQUIRE(path.measures_needed == 1);
    REQUIRE(path.target_reachable);
    REQUIRE(path.steps[0].measure == "A");
    REQUIRE_THAT(path.steps[0].distance_per_weight, WithinRel(0.02, 1e-12));
    REQUIRE_THAT(path.steps[0].single_measure_impact, WithinRel(1.0, 1e-12));
    REQUIRE_THAT(path.steps[0].cumulative_rating, WithinRel(4.0, 1e-12));
    REQUIRE_THAT(path.points_needed(), WithinRel(1.0, 1e-12));
}

TEST_CASE("Improvement path orders measures by distance per weight", "[path]") {
    RatingMap ratings{{"A", 2}, {"B", 3}, {"C", 4}};
    DistanceMap distances{{"A", 6.0}, {"B", 3.0}, {"C", 2.0}};
    MeasureWeights weights{{"A", 3.0}, {"B", 1.0}, {"C", 1.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 2.6, 3.25);

    // A: 6/3 = 2, C: 2/1 = 2, B: 3/1 = 3; ties keep key order
    REQUIRE(path.steps.size() == 3);
    REQUIRE(path.steps[0].measure == "A");
    REQUIRE(path.steps[1].measure == "C");
    REQUIRE(path.steps[2].measure == "B");

    REQUIRE_THAT(path.steps[0].single_measure_impact, WithinRel(0.6, 1e-12));
    REQUIRE_THAT(path.steps[0].cumulative_rating, WithinRel(3.2, 1e-12));
    REQUIRE_THAT(path.steps[1].cumulative_weight, WithinRel(4.0, 1e-12));
    REQUIRE_THAT(path.steps[1].cumulative_rating, WithinRel(3.4, 1e-12));

    REQUIRE(path.measures_needed == 2);
    REQUIRE(path.target_reachable);
}

TEST_CASE("Improvement path excludes ineligible measures", "[path]") {
    RatingMap ratings{{"A", 3}, {"Top", 5}, {"Missing", std::nullopt}, {"NoDist", 2}, {"Unweighted", 1}};
    DistanceMap distances{{"A", 4.0}, {"Top", 0.0}, {"Missing", std::nullopt}, {"NoDist", std::nullopt},
                          {"Unweighted", 1.0}};
    MeasureWeights weights{{"A", 1.0}, {"Top", 1.0}, {"Missing", 1.0}, {"NoDist", 2.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 3.0, 3.25);

    REQUIRE(path.steps.size() == 1);
    REQUIRE(path.steps[0].measure == "A");
    // Total weight covers every rated, weighted measure: A, Top, NoDist
    REQUIRE_THAT(path.steps[0].single_measure_impact, WithinRel(0.25, 1e-12));
    REQUIRE(path.target_reachable);
}

TEST_CASE("Improvement path ranks zero-weight measures last", "[path][boundary]") {
    RatingMap ratings{{"A", 3}, {"Z", 2}};
    DistanceMap distances{{"A", 10.0}, {"Z", 0.1}};
    MeasureWeights weights{{"A", 1.0}, {"Z", 0.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 3.0, 4.0);

    REQUIRE(path.steps.size() == 2);
    REQUIRE(path.steps[0].measure == "A");
    REQUIRE(std::isinf(path.steps[1].distance_per_weight));
    REQUIRE(path.steps[1].single_measure_impact == 0.0);
}

TEST_CASE("Improvement path uses absolute distances", "[path]") {
    RatingMap ratings{{"A", 2}, {"B", 2}};
    DistanceMap distances{{"A", -0.5}, {"B", 0.2}};
    MeasureWeights weights{{"A", 1.0}, {"B", 1.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 2.0, 3.0);

    REQUIRE(path.steps[0].measure == "B");
    REQUIRE_THAT(path.steps[1].distance_per_weight, WithinRel(0.5, 1e-12));
}

TEST_CASE("Improvement path reports an unreachable target", "[path]") {
    RatingMap ratings{{"A", 2}, {"B", 2}, {"C", 2}, {"D", 2}};
    DistanceMap distances{{"A", 1.0}, {"B", 2.0}, {"C", 3.0}, {"D", 4.0}};
    MeasureWeights weights{{"A", 1.0}, {"B", 1.0}, {"C", 1.0}, {"D", 1.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 2.0, 4.0);

    REQUIRE_FALSE(path.target_reachable);
    REQUIRE(path.measures_needed == 4);
    REQUIRE(path.steps.size() == 4);
    REQUIRE_THAT(path.steps.back().cumulative_rating, WithinRel(3.0, 1e-12));
}

TEST_CASE("Improvement path needs nothing when already at target", "[path]") {
    RatingMap ratings{{"A", 4}};
    DistanceMap distances{{"A", 1.0}};
    MeasureWeights weights{{"A", 1.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 4.0, 3.5);

    REQUIRE(path.measures_needed == 0);
    REQUIRE(path.target_reachable);
    REQUIRE(path.steps.size() == 1);
}

TEST_CASE("Improvement path with no eligible measures", "[path]") {
    RatingMap ratings{{"A", 5}};
    DistanceMap distances{{"A", 0.0}};
    MeasureWeights weights{{"A", 1.0}};

    auto path = compute_improvement_path(ratings, distances, weights, 4.5, 4.75);

    REQUIRE(path.steps.empty());
    REQUIRE(path.measures_needed == 0);
    REQUIRE_FALSE(path.target_reachable);
}
