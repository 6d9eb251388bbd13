#include "json_writer.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace starcast {
namespace io {

AnalysisDocument::AnalysisDocument()
    : organization_id(""),
      year(0),
      current(nullptr),
      fit(nullptr),
      simulation(nullptr),
      path(nullptr),
      strategies(nullptr),
      include_draws(false) {}

namespace {

std::string escape_json(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

// Tracks nesting, commas and indentation for the hand-written document.
// Non-finite numbers are written as null.
class JsonEmitter {
public:
    JsonEmitter(std::ostream& os, bool pretty) : os_(os), pretty_(pretty) {
        os_ << std::fixed << std::setprecision(6);
    }

    void begin_object() { open('{'); }
    void begin_object(const std::string& key) { write_key(key); open_after_key('{'); }
    void end_object() { close('}'); }

    void begin_array() { open('['); }
    void begin_array(const std::string& key) { write_key(key); open_after_key('['); }
    void end_array() { close(']'); }

    void field(const std::string& key, double value) { write_key(key); write_number(value); }
    void field(const std::string& key, std::optional<double> value) {
        write_key(key);
        if (value) write_number(*value); else os_ << "null";
    }
    void field(const std::string& key, std::optional<int> value) {
        write_key(key);
        if (value) os_ << *value; else os_ << "null";
    }
    void field(const std::string& key, int value) { write_key(key); os_ << value; }
    void field(const std::string& key, size_t value) { write_key(key); os_ << value; }
    void field(const std::string& key, bool value) { write_key(key); os_ << (value ? "true" : "false"); }
    void field(const std::string& key, const std::string& value) {
        write_key(key);
        os_ << "\"" << escape_json(value) << "\"";
    }
    void field(const std::string& key, const char* value) { field(key, std::string(value)); }

    void value(double v) { separator(); write_number(v); }
    void value(std::optional<double> v) {
        separator();
        if (v) write_number(*v); else os_ << "null";
    }
    void value(const std::string& v) { separator(); os_ << "\"" << escape_json(v) << "\""; }

    void finish() {
        if (pretty_) os_ << "\n";
    }

private:
    void separator() {
        if (!first_.empty()) {
            if (!first_.back()) {
                os_ << ",";
            }
            first_.back() = false;
            if (pretty_) {
                os_ << "\n" << std::string(first_.size() * 2, ' ');
            }
        }
    }

    void write_key(const std::string& key) {
        separator();
        os_ << "\"" << escape_json(key) << "\":" << (pretty_ ? " " : "");
    }

    void write_number(double v) {
        if (std::isfinite(v)) {
            os_ << v;
        } else {
            os_ << "null";
        }
    }

    void open(char bracket) {
        separator();
        open_after_key(bracket);
    }

    void open_after_key(char bracket) {
        os_ << bracket;
        first_.push_back(true);
    }

    void close(char bracket) {
        bool empty = first_.back();
        first_.pop_back();
        if (pretty_ && !empty) {
            os_ << "\n" << std::string(first_.size() * 2, ' ');
        }
        os_ << bracket;
    }

    std::ostream& os_;
    bool pretty_;
    std::vector<bool> first_;
};

void emit_distribution(JsonEmitter& json, const std::string& key, const RatingDistribution& dist) {
    json.begin_object(key);
    for (int level = MIN_RATING_LEVEL; level <= MAX_RATING_LEVEL; ++level) {
        json.field(std::to_string(level), dist.probability(level));
    }
    json.end_object();
}

void emit_simulation(JsonEmitter& json, const SimulationResult& result, bool include_draws) {
    json.begin_object("statistics");
    json.field("expected_rating", result.expected_rating);
    json.field("std_dev", result.std_dev);
    json.field("draws_requested", result.draws_requested);
    json.field("draws_completed", result.draws_completed);
    json.field("draws_rated", result.draws_rated);
    json.field("sampling_failures", result.sampling_failures);
    json.field("cancelled", result.cancelled);
    json.end_object();

    emit_distribution(json, "rating_probabilities", result.distribution);

    json.begin_object("measure_sources");
    for (const auto& [measure, tally] : result.sources) {
        json.begin_object(measure);
        json.field("sampled", tally.sampled);
        json.field("fallback", tally.fallback);
        json.field("unavailable", tally.unavailable);
        json.field("sampling_failures", tally.sampling_failures);
        json.end_object();
    }
    json.end_object();

    json.field("execution_time_ms", result.execution_time_ms);

    if (include_draws) {
        json.begin_array("simulated_ratings");
        for (const auto& rating : result.simulated_ratings) {
            json.value(rating);
        }
        json.end_array();

        json.begin_object("measure_draws");
        for (const auto& [measure, draws] : result.measure_draws) {
            json.begin_array(measure);
            for (const auto& draw : draws) {
                json.value(draw.value);
            }
            json.end_array();
        }
        json.end_object();
    }
}

void emit_snapshot(JsonEmitter& json, const RatingSnapshot& snapshot) {
    json.begin_object("current");
    json.field("aggregate_rating", snapshot.aggregate);
    json.begin_object("measures");
    for (const auto& [measure, level] : snapshot.ratings) {
        json.begin_object(measure);
        json.field("level", level);
        auto dist_it = snapshot.distances.find(measure);
        json.field("distance_to_next",
                   dist_it != snapshot.distances.end() ? dist_it->second : std::optional<double>());
        json.end_object();
    }
    json.end_object();
    json.begin_object("errors");
    for (const auto& [measure, message] : snapshot.errors) {
        json.field(measure, message);
    }
    json.end_object();
    json.end_object();
}

void emit_fit(JsonEmitter& json, const FitReport& fit) {
    json.begin_object("models");
    json.begin_array("fitted");
    for (const auto& [measure, model] : fit.models) {
        json.value(measure);
    }
    json.end_array();
    json.begin_array("insufficient_history");
    for (const auto& skip : fit.skipped) {
        json.begin_object();
        json.field("measure", skip.measure);
        json.field("observations", skip.observations);
        json.field("required", skip.required);
        json.end_object();
    }
    json.end_array();
    json.begin_array("failures");
    for (const auto& failure : fit.failures) {
        json.begin_object();
        json.field("measure", failure.measure);
        json.field("error", failure.message);
        json.end_object();
    }
    json.end_array();
    json.field("execution_time_ms", fit.execution_time_ms);
    json.end_object();
}

void emit_path(JsonEmitter& json, const ImprovementPath& path) {
    json.begin_object("improvement_path");
    json.field("current_rating", path.current_rating);
    json.field("target_rating", path.target_rating);
    json.field("points_needed", path.points_needed());
    json.field("target_reachable", path.target_reachable);
    json.field("measures_needed", path.measures_needed);
    json.begin_array("steps");
    for (const auto& step : path.steps) {
        json.begin_object();
        json.field("measure", step.measure);
        json.field("current_level", step.current_level);
        json.field("weight", step.weight);
        json.field("distance_to_next", step.distance_to_next);
        json.field("distance_per_weight", step.distance_per_weight);
        json.field("single_measure_impact", step.single_measure_impact);
        json.field("cumulative_weight", step.cumulative_weight);
        json.field("cumulative_rating", step.cumulative_rating);
        json.end_object();
    }
    json.end_array();
    json.end_object();
}

void emit_strategies(JsonEmitter& json, const StrategyReport& report) {
    json.begin_object("strategies");
    json.field("baseline_rating", report.baseline.expected_rating);
    json.field("baseline_value", report.baseline_value);
    json.begin_array("results");
    for (const auto& result : report.results) {
        json.begin_object();
        json.field("scenario", result.scenario);
        json.begin_object("adjustments");
        for (const auto& [measure, points] : result.adjustments) {
            json.field(measure, points);
        }
        json.end_object();
        json.field("baseline_rating", result.baseline_rating);
        json.field("improved_rating", result.improved_rating);
        json.field("rating_change", result.rating_change);
        json.field("baseline_value", result.valuation.baseline_value);
        json.field("improved_value", result.valuation.improved_value);
        json.field("economic_value_change", result.value_change);
        json.field("estimated_cost", result.estimated_cost);
        // null when the scenario costs nothing
        json.field("roi", result.roi);
        json.begin_object("probability_changes");
        for (int level = MIN_RATING_LEVEL; level <= MAX_RATING_LEVEL; ++level) {
            json.field(std::to_string(level), result.valuation.probability_change_for(level));
        }
        json.end_object();
        json.end_object();
    }
    json.end_array();
    json.begin_array("failures");
    for (const auto& failure : report.failures) {
        json.begin_object();
        json.field("scenario", failure.scenario);
        json.field("error", failure.message);
        json.end_object();
    }
    json.end_array();
    json.end_object();
}

} // anonymous namespace

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool include_draws, bool pretty_print) {
    JsonEmitter json(os, pretty_print);
    json.begin_object();
    emit_simulation(json, result, include_draws);
    json.end_object();
    json.finish();
}

void write_analysis_json(std::ostream& os, const AnalysisDocument& doc, bool pretty_print) {
    JsonEmitter json(os, pretty_print);
    json.begin_object();
    json.field("organization_id", doc.organization_id);
    json.field("year", doc.year);

    if (doc.current != nullptr) {
        emit_snapshot(json, *doc.current);
    }
    if (doc.fit != nullptr) {
        emit_fit(json, *doc.fit);
    }
    if (doc.simulation != nullptr) {
        json.begin_object("simulation");
        emit_simulation(json, *doc.simulation, doc.include_draws);
        json.end_object();
    }
    if (doc.path != nullptr) {
        emit_path(json, *doc.path);
    }
    if (doc.strategies != nullptr) {
        emit_strategies(json, *doc.strategies);
    }

    json.end_object();
    json.finish();
}

void write_analysis_json(const std::string& filepath, const AnalysisDocument& doc,
                         bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_analysis_json(file, doc, pretty_print);
}

} // namespace io
} // namespace starcast
