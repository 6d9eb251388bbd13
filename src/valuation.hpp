#ifndef STARCAST_VALUATION_HPP
#define STARCAST_VALUATION_HPP

#include "simulation.hpp"
#include <array>
#include <initializer_list>
#include <istream>
#include <map>
#include <string>
#include <utility>

namespace starcast {

// Dollar value per star level. Levels outside 1..5 and negative values are
// rejected; a level without an entry is worth 0.
class RatingValueTable {
public:
    RatingValueTable() = default;
    RatingValueTable(std::initializer_list<std::pair<const int, double>> init);

    void set(int level, double value);
    double value(int level) const;
    bool contains(int level) const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const std::map<int, double>& values() const { return values_; }

    // CSV with columns rating,value (header row expected)
    static RatingValueTable load_from_csv(const std::string& filepath);
    static RatingValueTable load_from_csv(std::istream& is);

private:
    std::map<int, double> values_;
};

// Sum over levels of probability x value
double expected_value(const RatingDistribution& distribution, const RatingValueTable& table);

// Economic comparison of two rating distributions
struct ValuationResult {
    double baseline_value;
    double improved_value;
    double net_change;                          // improved - baseline
    std::array<double, 5> probability_change;   // improved - baseline, levels 1..5

    ValuationResult();

    // Throws std::out_of_range for a level outside 1..5
    double probability_change_for(int level) const;
};

ValuationResult valuate(const RatingDistribution& baseline,
                        const RatingDistribution& improved,
                        const RatingValueTable& table);

// net_change / cost; +inf when cost is 0. Throws std::invalid_argument for
// a negative or NaN cost.
double compute_roi(double net_change, double cost);

// Baseline and adjusted simulations of one organization-year, valued
struct ImprovementValuation {
    SimulationResult baseline;
    SimulationResult improved;
    ValuationResult valuation;
    double expected_rating_change;
};

// Run the baseline and the adjusted simulation with the same seed, then
// value both. Throws NoDataForContractYear when the row is absent.
ImprovementValuation evaluate_improvement(const MeasurePanel& panel,
                                          const ModelMap& models,
                                          const ThresholdSet& thresholds,
                                          const MeasureWeights& weights,
                                          const std::string& organization_id,
                                          int year,
                                          const Adjustments& improvements,
                                          const RatingValueTable& values,
                                          const SimulationConfig& config = SimulationConfig());

} // namespace starcast

#endif // STARCAST_VALUATION_HPP
