#ifndef STARCAST_IMPROVEMENT_PATH_HPP
#define STARCAST_IMPROVEMENT_PATH_HPP

#include "star_rating.hpp"
#include <optional>
#include <string>
#include <vector>

namespace starcast {

// One candidate single-level improvement of one measure
struct ImprovementOpportunity {
    std::string measure;
    int current_level;
    double weight;
    double distance_to_next;
    double distance_per_weight;      // |distance| / weight, +inf for zero weight
    double single_measure_impact;    // weight / total included weight
    double cumulative_weight;
    double cumulative_rating;        // current rating + running sum of impacts
};

struct ImprovementPath {
    std::vector<ImprovementOpportunity> steps;   // Every eligible measure, cheapest first
    size_t measures_needed;                      // Minimal prefix reaching the target
    bool target_reachable;
    double current_rating;
    double target_rating;

    ImprovementPath();

    double points_needed() const { return target_rating - current_rating; }
};

// Greedy ordering of one-level improvements by distance per unit weight.
// Each step's effect on the composite is the first-order estimate
// weight / total weight, where total weight covers every weighted measure
// with a defined rating. Undefined, top-level and undefined-distance
// measures are not eligible.
//
// When no prefix reaches `target`, all steps are returned with
// target_reachable == false and measures_needed == steps.size(). A target
// at or below `current` needs no steps.
ImprovementPath compute_improvement_path(const RatingMap& ratings,
                                         const DistanceMap& distances,
                                         const MeasureWeights& weights,
                                         double current,
                                         double target);

// First composite cutoff strictly above `current` among
// {2.75, 3.25, 3.75, 4.25, 4.75}; nullopt above the last one
std::optional<double> next_rating_cutoff(double current);

} // namespace starcast

#endif // STARCAST_IMPROVEMENT_PATH_HPP
