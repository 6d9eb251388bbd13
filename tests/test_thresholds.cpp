#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <sstream>
#include "thresholds.hpp"

using namespace starcast;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

const double INF = std::numeric_limits<double>::infinity();

ThresholdTable screening_table() {
    return ThresholdTable("C: Breast Cancer Screening", {
        {0.0, 55.0, 1},
        {55.0, 70.0, 2},
        {70.0, 85.0, 3},
        {85.0, 95.0, 4},
        {95.0, 101.0, 5},
    });
}

const char* CUTPOINT_CSV =
    "2024 Star Ratings Cutpoints\n"
    "Measure,\"C01: Breast Cancer Screening\",D02: Call Center\n"
    "Label,Percent,Percent\n"
    "1 star,< 53 %,< 80\n"
    "2 star,>= 53 % to < 67 %,>= 80 to < 90\n"
    "3 star,>= 67 % to < 76 %,\n"
    "4 star,>= 76 % to < 85 %,bogus\n"
    "5 star,>= 85 %,>= 90\n";

} // anonymous namespace

// ============================================================================
// Band Parsing
// ============================================================================

TEST_CASE("parse_threshold reads closed ranges", "[thresholds][parse]") {
    auto bounds = parse_threshold(">= 53 % to < 67 %");
    REQUIRE_THAT(bounds.first, WithinRel(53.0, 1e-12));
    REQUIRE_THAT(bounds.second, WithinRel(67.0, 1e-12));
}

TEST_CASE("parse_threshold handles negative relative-change bounds", "[thresholds][parse]") {
    auto bounds = parse_threshold(">= -0.179809 to < 0");
    REQUIRE_THAT(bounds.first, WithinRel(-0.179809, 1e-12));
    REQUIRE_THAT(bounds.second, WithinAbs(0.0, 1e-12));
}

TEST_CASE("parse_threshold reads open-ended bands", "[thresholds][parse]") {
    auto below = parse_threshold("< 53 %");
    REQUIRE(below.first == -INF);
    REQUIRE_THAT(below.second, WithinRel(53.0, 1e-12));

    auto at_least = parse_threshold(">= 85 %");
    REQUIRE_THAT(at_least.first, WithinRel(85.0, 1e-12));
    REQUIRE(at_least.second == INF);

    auto above = parse_threshold("> -0.5");
    REQUIRE_THAT(above.first, WithinRel(-0.5, 1e-12));
    REQUIRE(above.second == INF);
}

TEST_CASE("parse_threshold maps a bare 100 to a degenerate band", "[thresholds][parse]") {
    auto bounds = parse_threshold("100 %");
    REQUIRE(bounds.first == 100.0);
    REQUIRE(bounds.second == 100.0);
}

TEST_CASE("parse_threshold rejects unrecognized text", "[thresholds][parse][error]") {
    REQUIRE_THROWS_AS(parse_threshold("bogus"), ThresholdParseError);
    REQUIRE_THROWS_AS(parse_threshold("to"), ThresholdParseError);
    REQUIRE_THROWS_AS(parse_threshold("<"), ThresholdParseError);
}

TEST_CASE("normalize_measure_key collapses the measure code", "[thresholds]") {
    REQUIRE(normalize_measure_key("C01: Breast Cancer Screening") == "C: Breast Cancer Screening");
    REQUIRE(normalize_measure_key("D02: Call Center") == "D: Call Center");
    REQUIRE(normalize_measure_key("No Colon Here") == "No Colon Here");
    REQUIRE(normalize_measure_key(":leading") == ":leading");
}

// ============================================================================
// ThresholdTable
// ============================================================================

TEST_CASE("ThresholdTable orders bands by level", "[thresholds]") {
    ThresholdTable table("m", {{70.0, 100.0, 3}, {-INF, 50.0, 1}, {50.0, 70.0, 2}});

    REQUIRE(table.bands().size() == 3);
    REQUIRE(table.bands()[0].level == 1);
    REQUIRE(table.bands()[2].level == 3);
    REQUIRE(table.highest_band().level == 3);
    REQUIRE(table.band_for_level(2) != nullptr);
    REQUIRE(table.band_for_level(5) == nullptr);
}

TEST_CASE("ThresholdTable rejects malformed bands", "[thresholds][error]") {
    REQUIRE_THROWS_AS(ThresholdTable("m", {{0.0, 10.0, 6}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ThresholdTable("m", {{0.0, 10.0, 0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ThresholdTable("m", {{10.0, 0.0, 1}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ThresholdTable("m", {{0.0, 10.0, 2}, {10.0, 20.0, 2}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ThresholdTable("m", {{std::nan(""), 10.0, 1}}), std::invalid_argument);
}

TEST_CASE("ThresholdTable contiguity check", "[thresholds]") {
    ThresholdTable full("m", {{-INF, 50.0, 1}, {50.0, 70.0, 2}, {70.0, INF, 3}});
    REQUIRE(full.is_contiguous());

    ThresholdTable gap("m", {{-INF, 50.0, 1}, {60.0, INF, 2}});
    REQUIRE_FALSE(gap.is_contiguous());

    REQUIRE_FALSE(screening_table().is_contiguous());
    REQUIRE_FALSE(ThresholdTable().is_contiguous());
}

// ============================================================================
// Classification
// ============================================================================

TEST_CASE("classify places a score in its band", "[thresholds][classify]") {
    auto c = classify(screening_table(), 74.0);

    REQUIRE(c.defined());
    REQUIRE(*c.level == 3);
    REQUIRE_THAT(*c.distance_to_next, WithinAbs(11.0, 1e-12));
}

TEST_CASE("classify uses half-open intervals", "[thresholds][classify][boundary]") {
    auto c = classify(screening_table(), 55.0);
    REQUIRE(*c.level == 2);
    REQUIRE_THAT(*c.distance_to_next, WithinAbs(15.0, 1e-12));

    auto below = classify(screening_table(), 54.999);
    REQUIRE(*below.level == 1);
}

TEST_CASE("classify gives zero distance at the top level", "[thresholds][classify]") {
    auto c = classify(screening_table(), 97.0);
    REQUIRE(*c.level == 5);
    REQUIRE(*c.distance_to_next == 0.0);
}

TEST_CASE("classify rescues scores at the top band's upper edge", "[thresholds][classify][boundary]") {
    auto c = classify(screening_table(), 101.0);
    REQUIRE(*c.level == 5);

    ThresholdTable perfect("m", {{85.0, 100.0, 4}, {100.0, 100.0, 5}});
    auto p = classify(perfect, 100.0);
    REQUIRE(*p.level == 5);
    REQUIRE(*p.distance_to_next == 0.0);
}

TEST_CASE("classify leaves missing scores undefined", "[thresholds][classify]") {
    auto missing = classify(screening_table(), std::nullopt);
    REQUIRE_FALSE(missing.defined());
    REQUIRE_FALSE(missing.distance_to_next.has_value());

    auto nan = classify(screening_table(), std::nan(""));
    REQUIRE_FALSE(nan.defined());
}

TEST_CASE("classify throws for a score outside every band", "[thresholds][classify][error]") {
    REQUIRE_THROWS_AS(classify(screening_table(), -1.0), ScoreOutOfRange);
    REQUIRE_THROWS_AS(classify(ThresholdTable("empty", {}), 50.0), ScoreOutOfRange);
}

TEST_CASE("classify reports no distance when the next level has no band", "[thresholds][classify]") {
    ThresholdTable sparse("m", {{-INF, 80.0, 1}, {80.0, 90.0, 2}, {90.0, INF, 5}});
    auto c = classify(sparse, 85.0);
    REQUIRE(*c.level == 2);
    REQUIRE_FALSE(c.distance_to_next.has_value());
}

TEST_CASE("classify by measure key", "[thresholds][classify]") {
    ThresholdSet set;
    set.add(screening_table());

    auto c = classify("C: Breast Cancer Screening", 90.0, set);
    REQUIRE(*c.level == 4);
    REQUIRE_THAT(*c.distance_to_next, WithinAbs(5.0, 1e-12));

    REQUIRE_THROWS_AS(classify("C: Unknown", 90.0, set), UnknownMeasure);
}

// ============================================================================
// ThresholdSet Loading
// ============================================================================

TEST_CASE("ThresholdSet loads a cutpoint table", "[thresholds][csv]") {
    std::istringstream is(CUTPOINT_CSV);
    auto set = ThresholdSet::load_from_csv(is, 1);

    REQUIRE(set.size() == 2);
    REQUIRE(set.contains("C: Breast Cancer Screening"));
    REQUIRE(set.contains("D: Call Center"));

    const auto& screening = set.get("C: Breast Cancer Screening");
    REQUIRE(screening.bands().size() == 5);
    REQUIRE(screening.is_contiguous());
    REQUIRE(*classify(screening, 70.0).level == 3);
    REQUIRE_THAT(*classify(screening, 70.0).distance_to_next, WithinAbs(6.0, 1e-12));

    // The unparseable 4-star cell and the empty 3-star cell are skipped
    const auto& call_center = set.get("D: Call Center");
    REQUIRE(call_center.bands().size() == 3);
    REQUIRE(call_center.band_for_level(4) == nullptr);
    REQUIRE(*classify(call_center, 95.0).level == 5);
}

TEST_CASE("ThresholdSet keeps raw keys on request", "[thresholds][csv]") {
    std::istringstream is(CUTPOINT_CSV);
    auto set = ThresholdSet::load_from_csv(is, 1, false);

    REQUIRE(set.contains("C01: Breast Cancer Screening"));
    REQUIRE_FALSE(set.contains("C: Breast Cancer Screening"));
}

TEST_CASE("ThresholdSet omits measures without any band", "[thresholds][csv]") {
    std::istringstream is(
        "Measure,A: Kept,B: Empty\n"
        "1 star,< 50,\n"
        "2 star,>= 50,not a band\n");
    auto set = ThresholdSet::load_from_csv(is);

    REQUIRE(set.size() == 1);
    REQUIRE(set.measures() == std::vector<std::string>{"A: Kept"});
}

TEST_CASE("ThresholdSet rejects a missing header", "[thresholds][csv][error]") {
    std::istringstream is("only_one_column\n");
    REQUIRE_THROWS_AS(ThresholdSet::load_from_csv(is), std::runtime_error);
    REQUIRE_THROWS_AS(ThresholdSet::load_from_csv("/nonexistent/cutpoints.csv"), std::runtime_error);
}

TEST_CASE("ThresholdSet get throws for an unknown measure", "[thresholds][error]") {
    ThresholdSet set;
    REQUIRE(set.empty());
    REQUIRE_THROWS_AS(set.get("missing"), UnknownMeasure);
}
