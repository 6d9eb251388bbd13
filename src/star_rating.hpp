#ifndef STARCAST_STAR_RATING_HPP
#define STARCAST_STAR_RATING_HPP

#include "thresholds.hpp"
#include <initializer_list>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace starcast {

// Rating level per measure; nullopt marks an undefined (missing) rating
using RatingMap = std::map<std::string, std::optional<int>>;
using DistanceMap = std::map<std::string, std::optional<double>>;
using ScoreMap = std::map<std::string, std::optional<double>>;

// Measure weights used for the composite rating.
// Zero and tied weights are legal; negative or NaN weights are rejected.
class MeasureWeights {
public:
    MeasureWeights() = default;
    MeasureWeights(std::initializer_list<std::pair<const std::string, double>> init);

    void set(const std::string& measure, double weight);
    std::optional<double> get(const std::string& measure) const;
    bool contains(const std::string& measure) const;
    // Throws UnknownMeasure
    double at(const std::string& measure) const;

    size_t size() const { return weights_.size(); }
    bool empty() const { return weights_.empty(); }
    const std::map<std::string, double>& weights() const { return weights_; }

    // CSV with columns measure,weight (header row expected)
    static MeasureWeights load_from_csv(const std::string& filepath, bool normalize_keys = true);
    static MeasureWeights load_from_csv(std::istream& is, bool normalize_keys = true);

private:
    std::map<std::string, double> weights_;
};

// Weighted mean of the defined ratings that also carry a weight.
// Returns nullopt when the included weight sums to zero. Not clamped.
std::optional<double> aggregate_rating(const RatingMap& ratings, const MeasureWeights& weights);

// Ratings, distances and composite rating of one set of scores
struct RatingSnapshot {
    RatingMap ratings;
    DistanceMap distances;
    std::optional<double> aggregate;
    // Measures whose classification failed (unknown measure or out of range)
    std::map<std::string, std::string> errors;
};

// Rate every weighted measure present in `scores`. Unweighted measures are
// skipped; classification failures leave the measure undefined and are
// reported in `errors`.
RatingSnapshot rate_row(const ScoreMap& scores,
                        const ThresholdSet& thresholds,
                        const MeasureWeights& weights);

} // namespace starcast

#endif // STARCAST_STAR_RATING_HPP
