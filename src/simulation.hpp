#ifndef STARCAST_SIMULATION_HPP
#define STARCAST_SIMULATION_HPP

#include "measure_panel.hpp"
#include "model_fitting.hpp"
#include "star_rating.hpp"
#include "thresholds.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace starcast {

// Fixed binning of composite ratings into star levels. A rating at or above
// cutoffs[k] (and below cutoffs[k+1]) maps to levels[k]; below cutoffs[0] is
// level 1. Half-star bins floor to their whole level.
struct RatingBins {
    std::array<double, 6> cutoffs;
    std::array<int, 6> levels;

    RatingBins();

    int level_for(double rating) const;
};

// Probabilities of levels 1..5
struct RatingDistribution {
    std::array<double, 5> probabilities;

    RatingDistribution();

    // Throws std::out_of_range for a level outside 1..5
    double probability(int level) const;
    void set_probability(int level, double p);
    double total() const;

    // Empirical distribution of the given ratings; all zeros when empty
    static RatingDistribution from_ratings(const std::vector<double>& ratings,
                                           const RatingBins& bins = RatingBins());
};

enum class DrawSource {
    Sampled,      // Drawn from the measure's fitted model
    Fallback,     // Observed value (no model, or sampling failed)
    Unavailable   // No model and no observed value
};

std::string draw_source_to_string(DrawSource source);

struct MeasureDraw {
    DrawSource source;
    std::optional<double> value;   // Percentage units, after adjustment and clipping
};

struct SourceTally {
    size_t sampled;
    size_t fallback;
    size_t unavailable;
    size_t sampling_failures;

    SourceTally() : sampled(0), fallback(0), unavailable(0), sampling_failures(0) {}
};

// Fixed additive changes (percentage points) applied to modeled measures
using Adjustments = std::map<std::string, double>;

struct SimulationConfig {
    size_t n_draws;                      // Number of Monte Carlo draws (default 1000)
    uint64_t seed;                       // Base seed; draw i is seeded from (seed, i)
    bool store_draws;                    // Keep per-measure draw values
    RatingBins bins;
    const std::atomic<bool>* cancel;     // Optional external stop flag
    double time_budget_ms;               // Stop after this much wall time; 0 means no limit

    SimulationConfig();
};

struct SimulationResult {
    RatingDistribution distribution;
    double expected_rating;              // Mean of rated draws
    double std_dev;                      // Population standard deviation of rated draws

    // Aggregate rating per completed draw (nullopt when the draw was unrated)
    std::vector<std::optional<double>> simulated_ratings;
    // Per measure, one entry per completed draw (only with store_draws)
    std::map<std::string, std::vector<MeasureDraw>> measure_draws;
    std::map<std::string, SourceTally> sources;

    size_t draws_requested;
    size_t draws_completed;
    size_t draws_rated;
    size_t sampling_failures;            // Measure-draw sampling failures
    bool cancelled;
    double execution_time_ms;

    SimulationResult();
};

// Simulate the composite rating of one organization-year. Throws
// NoDataForContractYear before any draw when the row is absent.
SimulationResult run_simulation(const MeasurePanel& panel,
                                const ModelMap& models,
                                const ThresholdSet& thresholds,
                                const MeasureWeights& weights,
                                const std::string& organization_id,
                                int year,
                                const SimulationConfig& config = SimulationConfig(),
                                const Adjustments& adjustments = Adjustments());

// Simulate from a row directly. Weighted measures define the draw:
//   - modeled: sample x100, add adjustment, clip to [0, 100]
//   - unmodeled: the row's observed value, else Unavailable
SimulationResult run_simulation(const ObservationRow& row,
                                const ModelMap& models,
                                const ThresholdSet& thresholds,
                                const MeasureWeights& weights,
                                const SimulationConfig& config = SimulationConfig(),
                                const Adjustments& adjustments = Adjustments());

} // namespace starcast

#endif // STARCAST_SIMULATION_HPP
