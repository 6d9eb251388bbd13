#include "valuation.hpp"
#include "io/csv_reader.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace starcast {

// ============================================================================
// RatingValueTable Implementation
// ============================================================================

RatingValueTable::RatingValueTable(std::initializer_list<std::pair<const int, double>> init) {
    for (const auto& [level, value] : init) {
        set(level, value);
    }
}

void RatingValueTable::set(int level, double value) {
    if (level < MIN_RATING_LEVEL || level > MAX_RATING_LEVEL) {
        throw std::invalid_argument("Rating level must be 1-5, got " + std::to_string(level));
    }
    if (std::isnan(value) || value < 0.0) {
        throw std::invalid_argument("Value for rating " + std::to_string(level) + " must be non-negative");
    }
    values_[level] = value;
}

double RatingValueTable::value(int level) const {
    auto it = values_.find(level);
    if (it == values_.end()) {
        return 0.0;
    }
    return it->second;
}

bool RatingValueTable::contains(int level) const {
    return values_.find(level) != values_.end();
}

RatingValueTable RatingValueTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open rating value file: " + filepath);
    }
    return load_from_csv(file);
}

RatingValueTable RatingValueTable::load_from_csv(std::istream& is) {
    RatingValueTable table;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (row.size() < 2) {
            throw std::runtime_error("Rating value CSV requires columns: rating,value");
        }

        auto rating = CsvReader::parse_number(row[0]);
        auto value = CsvReader::parse_number(row[1]);
        if (!rating || !value) {
            throw std::runtime_error("Invalid rating value row at line " + std::to_string(reader.rows_read()));
        }
        if (*rating != std::floor(*rating)) {
            throw std::invalid_argument("Rating level must be a whole number, got " + row[0]);
        }
        table.set(static_cast<int>(*rating), *value);
    }

    return table;
}

// ============================================================================
// Valuation Implementation
// ============================================================================

double expected_value(const RatingDistribution& distribution, const RatingValueTable& table) {
    double total = 0.0;
    for (int level = MIN_RATING_LEVEL; level <= MAX_RATING_LEVEL; ++level) {
        total += distribution.probability(level) * table.value(level);
    }
    return total;
}

ValuationResult::ValuationResult()
    : baseline_value(0.0),
      improved_value(0.0),
      net_change(0.0),
      probability_change{0.0, 0.0, 0.0, 0.0, 0.0} {}

double ValuationResult::probability_change_for(int level) const {
    if (level < MIN_RATING_LEVEL || level > MAX_RATING_LEVEL) {
        throw std::out_of_range("Rating level must be 1-5, got " + std::to_string(level));
    }
    return probability_change[static_cast<size_t>(level - 1)];
}

ValuationResult valuate(const RatingDistribution& baseline,
                        const RatingDistribution& improved,
                        const RatingValueTable& table) {
    ValuationResult result;
    result.baseline_value = expected_value(baseline, table);
    result.improved_value = expected_value(improved, table);
    result.net_change = result.improved_value - result.baseline_value;
    for (size_t k = 0; k < result.probability_change.size(); ++k) {
        result.probability_change[k] = improved.probabilities[k] - baseline.probabilities[k];
    }
    return result;
}

double compute_roi(double net_change, double cost) {
    if (std::isnan(cost) || cost < 0.0) {
        throw std::invalid_argument("Cost must be non-negative");
    }
    if (cost == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return net_change / cost;
}

ImprovementValuation evaluate_improvement(const MeasurePanel& panel,
                                          const ModelMap& models,
                                          const ThresholdSet& thresholds,
                                          const MeasureWeights& weights,
                                          const std::string& organization_id,
                                          int year,
                                          const Adjustments& improvements,
                                          const RatingValueTable& values,
                                          const SimulationConfig& config) {
    const ObservationRow& row = panel.get(organization_id, year);

    ImprovementValuation out;
    out.baseline = run_simulation(row, models, thresholds, weights, config);
    out.improved = run_simulation(row, models, thresholds, weights, config, improvements);
    out.valuation = valuate(out.baseline.distribution, out.improved.distribution, values);
    out.expected_rating_change = out.improved.expected_rating - out.baseline.expected_rating;
    return out;
}

} // namespace starcast
