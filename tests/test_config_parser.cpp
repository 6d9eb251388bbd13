/**
 * @file test_config_parser.cpp
 * @brief Unit tests for analysis configuration parsing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "config_parser.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace starcast;
using Catch::Matchers::WithinRel;

namespace fs = std::filesystem;

TEST_CASE("Parse minimal analysis config", "[config]") {
    std::string json = R"({
        "inputs": {
            "panel": "data/panel.csv",
            "thresholds": "data/cutpoints.csv",
            "weights": "data/weights.csv"
        },
        "analysis": {
            "organization_id": "H1234",
            "year": 2024
        }
    })";

    auto config = parse_analysis_config_from_string(json);

    REQUIRE(config.inputs.panel == "data/panel.csv");
    REQUIRE(config.inputs.thresholds == "data/cutpoints.csv");
    REQUIRE(config.inputs.weights == "data/weights.csv");
    REQUIRE(config.inputs.threshold_preamble_rows == 0);
    REQUIRE(config.organization_id == "H1234");
    REQUIRE(config.year == 2024);

    // Defaults
    REQUIRE_FALSE(config.target_rating.has_value());
    REQUIRE(config.cost_per_point == 10000.0);
    REQUIRE(config.simulation.n_draws == 1000);
    REQUIRE(config.fitting.min_observations == 10);
    REQUIRE(config.generate_scenarios);
    REQUIRE(config.output_path.empty());

    REQUIRE_NOTHROW(validate_analysis_config(config));
}

TEST_CASE("Parse full analysis config", "[config]") {
    std::string json = R"({
        "description": "Star forecast",
        "inputs": {
            "panel": "panel.parquet",
            "thresholds": "cutpoints.csv",
            "threshold_preamble_rows": 2,
            "weights": {"C01: Breast Cancer Screening": 1, "C12: Diabetes Care": 3},
            "rating_values": {"3": 100000, "4": 250000, "5": 500000},
            "scenarios": "scenarios.csv"
        },
        "analysis": {
            "organization_id": "H5678",
            "year": 2025,
            "target_rating": 4.0,
            "cost_per_point": 2500,
            "measure_prefix": "C:"
        },
        "simulation": {
            "n_draws": 5000,
            "seed": 7,
            "store_draws": true,
            "time_budget_ms": 30000
        },
        "fitting": {
            "min_observations": 20,
            "boundary_epsilon": 0.001,
            "max_iterations": 500,
            "ridge_penalty": 0.01
        },
        "scenarios": {
            "generate": false,
            "step": 2,
            "high_weight_threshold": 1.5
        },
        "logging": {
            "level": "DEBUG",
            "json": false,
            "max_sampling_warnings": 3
        },
        "output": {"path": "result.json"}
    })";

    auto config = parse_analysis_config_from_string(json);

    REQUIRE(config.description == "Star forecast");
    REQUIRE(config.inputs.threshold_preamble_rows == 2);
    REQUIRE(config.inputs.weights.empty());
    REQUIRE(config.weights.size() == 2);
    REQUIRE_THAT(config.weights.at("C: Diabetes Care"), WithinRel(3.0, 1e-12));
    REQUIRE(config.rating_values.size() == 3);
    REQUIRE_THAT(config.rating_values.value(4), WithinRel(250000.0, 1e-12));
    REQUIRE(config.inputs.scenarios == "scenarios.csv");

    REQUIRE(*config.target_rating == 4.0);
    REQUIRE(config.cost_per_point == 2500.0);
    REQUIRE(config.measure_prefix == "C:");

    REQUIRE(config.simulation.n_draws == 5000);
    REQUIRE(config.simulation.seed == 7);
    REQUIRE(config.simulation.store_draws);
    REQUIRE(config.simulation.time_budget_ms == 30000.0);

    REQUIRE(config.fitting.min_observations == 20);
    REQUIRE(config.fitting.boundary_epsilon == 0.001);
    REQUIRE(config.fitting.max_iterations == 500);

    REQUIRE_FALSE(config.generate_scenarios);
    REQUIRE(config.scenario_step == 2.0);
    REQUIRE(config.high_weight_threshold == 1.5);

    REQUIRE(config.logging.min_level == LogLevel::DEBUG);
    REQUIRE_FALSE(config.logging.enable_json);
    REQUIRE(config.logging.max_sampling_warnings == 3);

    REQUIRE(config.output_path == "result.json");

    REQUIRE_NOTHROW(validate_analysis_config(config));
}

TEST_CASE("Config parse errors", "[config][error]") {
    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string("{ not json"), ConfigParseError);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"analysis": {"year": "soon"}})"),
                          ConfigParseError);
    }

    SECTION("Non-positive draw count") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"simulation": {"n_draws": 0}})"),
                          ConfigParseError);
    }

    SECTION("Negative cost per point") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"analysis": {"cost_per_point": -1}})"),
                          ConfigParseError);
    }

    SECTION("Boundary epsilon out of range") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"fitting": {"boundary_epsilon": 0.5}})"),
                          ConfigParseError);
    }

    SECTION("Unknown log level") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"logging": {"level": "LOUD"}})"),
                          ConfigParseError);
    }

    SECTION("Negative inline weight") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"inputs": {"weights": {"A": -1}}})"),
                          ConfigParseError);
    }

    SECTION("Fractional or out-of-range rating level") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"inputs": {"rating_values": {"3.5": 1}}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"inputs": {"rating_values": {"6": 1}}})"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"inputs": {"rating_values": {"top": 1}}})"),
                          ConfigParseError);
    }

    SECTION("Weights of the wrong kind") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_string(R"({"inputs": {"weights": [1, 2]}})"),
                          ConfigParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_analysis_config_from_file("/nonexistent/config.json"), ConfigParseError);
    }
}

TEST_CASE("Config validation", "[config][error]") {
    AnalysisConfig config;
    config.inputs.panel = "panel.csv";
    config.inputs.thresholds = "cutpoints.csv";
    config.weights.set("A", 1.0);
    config.organization_id = "H1";
    config.year = 2024;
    REQUIRE_NOTHROW(validate_analysis_config(config));

    SECTION("Missing panel") {
        config.inputs.panel.clear();
        REQUIRE_THROWS_AS(validate_analysis_config(config), ConfigParseError);
    }

    SECTION("Missing weights") {
        config.weights = MeasureWeights();
        REQUIRE_THROWS_AS(validate_analysis_config(config), ConfigParseError);
    }

    SECTION("Missing organization") {
        config.organization_id.clear();
        REQUIRE_THROWS_AS(validate_analysis_config(config), ConfigParseError);
    }

    SECTION("Missing year") {
        config.year = 0;
        REQUIRE_THROWS_AS(validate_analysis_config(config), ConfigParseError);
    }
}

TEST_CASE("Environment variable expansion", "[config]") {
#ifdef _WIN32
    _putenv_s("STARCAST_TEST_DIR", "/data/stars");
#else
    setenv("STARCAST_TEST_DIR", "/data/stars", 1);
#endif

    REQUIRE(expand_environment_variables("${STARCAST_TEST_DIR}/panel.csv") == "/data/stars/panel.csv");
    REQUIRE(expand_environment_variables("$STARCAST_TEST_DIR/x") == "/data/stars/x");
    REQUIRE(expand_environment_variables("no variables") == "no variables");
    REQUIRE(expand_environment_variables("costs $ 5") == "costs $ 5");
    REQUIRE(expand_environment_variables("${UNCLOSED") == "${UNCLOSED");
    REQUIRE(expand_environment_variables("${STARCAST_SURELY_UNSET_VAR}") == "");
}

TEST_CASE("Relative path resolution", "[config]") {
    REQUIRE(resolve_relative_path("/abs/panel.csv", "/etc/starcast/config.json") == "/abs/panel.csv");
    REQUIRE(fs::path(resolve_relative_path("panel.csv", "/etc/starcast/config.json")) ==
            fs::path("/etc/starcast/panel.csv"));
    REQUIRE(resolve_relative_path("", "/etc/starcast/config.json").empty());
}

TEST_CASE("Config file paths resolve against the config directory", "[config]") {
    fs::path dir = fs::temp_directory_path() / "starcast_config_test";
    fs::create_directories(dir);
    fs::path file = dir / "analysis.json";

    {
        std::ofstream out(file);
        out << R"({
            "inputs": {"panel": "panel.csv", "thresholds": "/abs/cutpoints.csv", "weights": "w.csv"},
            "analysis": {"organization_id": "H1", "year": 2024},
            "output": {"path": "out/result.json"}
        })";
    }

    auto config = parse_analysis_config_from_file(file.string());

    REQUIRE(fs::path(config.inputs.panel) == dir / "panel.csv");
    REQUIRE(config.inputs.thresholds == "/abs/cutpoints.csv");
    REQUIRE(fs::path(config.inputs.weights) == dir / "w.csv");
    REQUIRE(fs::path(config.output_path) == dir / "out/result.json");
    REQUIRE(config.inputs.scenarios.empty());

    fs::remove_all(dir);
}
