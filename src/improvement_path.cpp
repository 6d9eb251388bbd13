#include "improvement_path.hpp"
#include "thresholds.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace starcast {

ImprovementPath::ImprovementPath()
    : measures_needed(0),
      target_reachable(false),
      current_rating(0.0),
      target_rating(0.0) {}

ImprovementPath compute_improvement_path(const RatingMap& ratings,
                                         const DistanceMap& distances,
                                         const MeasureWeights& weights,
                                         double current,
                                         double target) {
    ImprovementPath path;
    path.current_rating = current;
    path.target_rating = target;

    double total_weight = 0.0;
    for (const auto& [measure, level] : ratings) {
        auto weight = weights.get(measure);
        if (level && weight) {
            total_weight += *weight;
        }
    }

    for (const auto& [measure, level] : ratings) {
        auto weight = weights.get(measure);
        if (!weight || !level || *level >= MAX_RATING_LEVEL) {
            continue;
        }
        auto dist_it = distances.find(measure);
        if (dist_it == distances.end() || !dist_it->second) {
            continue;
        }

        ImprovementOpportunity opp;
        opp.measure = measure;
        opp.current_level = *level;
        opp.weight = *weight;
        opp.distance_to_next = *dist_it->second;
        opp.distance_per_weight = *weight > 0.0
            ? std::abs(opp.distance_to_next) / *weight
            : std::numeric_limits<double>::infinity();
        opp.single_measure_impact = total_weight > 0.0 ? *weight / total_weight : 0.0;
        opp.cumulative_weight = 0.0;
        opp.cumulative_rating = 0.0;
        path.steps.push_back(opp);
    }

    std::stable_sort(path.steps.begin(), path.steps.end(),
                     [](const ImprovementOpportunity& a, const ImprovementOpportunity& b) {
                         return a.distance_per_weight < b.distance_per_weight;
                     });

    double cumulative_weight = 0.0;
    double cumulative_rating = current;
    for (auto& step : path.steps) {
        cumulative_weight += step.weight;
        cumulative_rating += step.single_measure_impact;
        step.cumulative_weight = cumulative_weight;
        step.cumulative_rating = cumulative_rating;
    }

    if (current >= target) {
        path.measures_needed = 0;
        path.target_reachable = true;
        return path;
    }

    for (size_t i = 0; i < path.steps.size(); ++i) {
        if (path.steps[i].cumulative_rating >= target) {
            path.measures_needed = i + 1;
            path.target_reachable = true;
            return path;
        }
    }

    // Improving every eligible measure by one level still falls short
    path.measures_needed = path.steps.size();
    path.target_reachable = false;
    return path;
}

std::optional<double> next_rating_cutoff(double current) {
    static const std::array<double, 5> cutoffs{2.75, 3.25, 3.75, 4.25, 4.75};
    for (double cutoff : cutoffs) {
        if (cutoff > current) {
            return cutoff;
        }
    }
    return std::nullopt;
}

} // namespace starcast
