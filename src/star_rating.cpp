#include "star_rating.hpp"
#include "io/csv_reader.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace starcast {

// ============================================================================
// MeasureWeights Implementation
// ============================================================================

MeasureWeights::MeasureWeights(std::initializer_list<std::pair<const std::string, double>> init) {
    for (const auto& [measure, weight] : init) {
        set(measure, weight);
    }
}

void MeasureWeights::set(const std::string& measure, double weight) {
    if (std::isnan(weight) || weight < 0.0) {
        throw std::invalid_argument("Weight for " + measure + " must be non-negative");
    }
    weights_[measure] = weight;
}

std::optional<double> MeasureWeights::get(const std::string& measure) const {
    auto it = weights_.find(measure);
    if (it == weights_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MeasureWeights::contains(const std::string& measure) const {
    return weights_.find(measure) != weights_.end();
}

double MeasureWeights::at(const std::string& measure) const {
    auto it = weights_.find(measure);
    if (it == weights_.end()) {
        throw UnknownMeasure(measure);
    }
    return it->second;
}

MeasureWeights MeasureWeights::load_from_csv(const std::string& filepath, bool normalize_keys) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open weights file: " + filepath);
    }
    return load_from_csv(file, normalize_keys);
}

MeasureWeights MeasureWeights::load_from_csv(std::istream& is, bool normalize_keys) {
    MeasureWeights weights;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (row.size() < 2) {
            throw std::runtime_error("Weights CSV requires columns: measure,weight");
        }

        auto weight = CsvReader::parse_number(row[1]);
        if (!weight) {
            throw std::runtime_error("Non-numeric weight for measure " + row[0]);
        }
        weights.set(normalize_keys ? normalize_measure_key(row[0]) : row[0], *weight);
    }

    return weights;
}

// ============================================================================
// Aggregation
// ============================================================================

std::optional<double> aggregate_rating(const RatingMap& ratings, const MeasureWeights& weights) {
    double total_score = 0.0;
    double total_weight = 0.0;

    for (const auto& [measure, weight] : weights.weights()) {
        auto it = ratings.find(measure);
        if (it == ratings.end() || !it->second) {
            continue;
        }
        total_score += static_cast<double>(*it->second) * weight;
        total_weight += weight;
    }

    if (total_weight > 0.0) {
        return total_score / total_weight;
    }
    return std::nullopt;
}

RatingSnapshot rate_row(const ScoreMap& scores,
                        const ThresholdSet& thresholds,
                        const MeasureWeights& weights) {
    RatingSnapshot snapshot;

    for (const auto& [measure, score] : scores) {
        if (!weights.contains(measure)) {
            continue;
        }

        try {
            Classification c = classify(measure, score, thresholds);
            snapshot.ratings[measure] = c.level;
            snapshot.distances[measure] = c.distance_to_next;
        } catch (const UnknownMeasure& e) {
            snapshot.ratings[measure] = std::nullopt;
            snapshot.distances[measure] = std::nullopt;
            snapshot.errors[measure] = e.what();
        } catch (const ScoreOutOfRange& e) {
            snapshot.ratings[measure] = std::nullopt;
            snapshot.distances[measure] = std::nullopt;
            snapshot.errors[measure] = e.what();
        }
    }

    snapshot.aggregate = aggregate_rating(snapshot.ratings, weights);
    return snapshot;
}

} // namespace starcast
