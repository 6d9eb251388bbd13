#include "simulation.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace starcast {

// ============================================================================
// RatingBins / RatingDistribution Implementation
// ============================================================================

RatingBins::RatingBins()
    : cutoffs{1.75, 2.75, 3.25, 3.75, 4.25, 4.75},
      levels{2, 3, 3, 4, 4, 5} {}

int RatingBins::level_for(double rating) const {
    int level = MIN_RATING_LEVEL;
    for (size_t k = 0; k < cutoffs.size(); ++k) {
        if (rating >= cutoffs[k]) {
            level = levels[k];
        }
    }
    return level;
}

RatingDistribution::RatingDistribution()
    : probabilities{0.0, 0.0, 0.0, 0.0, 0.0} {}

double RatingDistribution::probability(int level) const {
    if (level < MIN_RATING_LEVEL || level > MAX_RATING_LEVEL) {
        throw std::out_of_range("Rating level must be 1-5, got " + std::to_string(level));
    }
    return probabilities[static_cast<size_t>(level - 1)];
}

void RatingDistribution::set_probability(int level, double p) {
    if (level < MIN_RATING_LEVEL || level > MAX_RATING_LEVEL) {
        throw std::out_of_range("Rating level must be 1-5, got " + std::to_string(level));
    }
    probabilities[static_cast<size_t>(level - 1)] = p;
}

double RatingDistribution::total() const {
    return std::accumulate(probabilities.begin(), probabilities.end(), 0.0);
}

RatingDistribution RatingDistribution::from_ratings(const std::vector<double>& ratings,
                                                    const RatingBins& bins) {
    RatingDistribution dist;
    if (ratings.empty()) {
        return dist;
    }

    std::array<size_t, 5> counts{0, 0, 0, 0, 0};
    for (double r : ratings) {
        counts[static_cast<size_t>(bins.level_for(r) - 1)]++;
    }
    for (size_t k = 0; k < counts.size(); ++k) {
        dist.probabilities[k] = static_cast<double>(counts[k]) / static_cast<double>(ratings.size());
    }
    return dist;
}

std::string draw_source_to_string(DrawSource source) {
    switch (source) {
        case DrawSource::Sampled: return "sampled";
        case DrawSource::Fallback: return "fallback";
        case DrawSource::Unavailable: return "unavailable";
        default: return "unknown";
    }
}

// ============================================================================
// Config / Result Implementation
// ============================================================================

SimulationConfig::SimulationConfig()
    : n_draws(1000),
      seed(42),
      store_draws(false),
      bins(),
      cancel(nullptr),
      time_budget_ms(0.0) {}

SimulationResult::SimulationResult()
    : expected_rating(0.0),
      std_dev(0.0),
      draws_requested(0),
      draws_completed(0),
      draws_rated(0),
      sampling_failures(0),
      cancelled(false),
      execution_time_ms(0.0) {}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

namespace {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

// Population standard deviation
double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

// Per-draw generator, independent of thread scheduling
std::mt19937_64 make_draw_rng(uint64_t seed, uint64_t index) {
    std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32),
                      static_cast<uint32_t>(index), static_cast<uint32_t>(index >> 32)};
    return std::mt19937_64(seq);
}

// Everything a draw needs for one weighted measure, built before the loop
struct MeasurePlan {
    std::string measure;
    const ThresholdTable* table = nullptr;
    bool modeled = false;
    std::unique_ptr<DrawGenerator> generator;
    std::string generator_error;
    std::optional<double> actual;
    std::optional<double> adjustment;
};

MeasureDraw draw_measure(const MeasurePlan& plan, std::mt19937_64& rng, std::string& failure) {
    if (plan.modeled) {
        if (plan.generator) {
            // Any failure here costs only this measure in this draw
            try {
                double value = plan.generator->draw(rng) * 100.0;
                if (!std::isfinite(value)) {
                    throw SamplingError("Non-finite draw for " + plan.measure);
                }
                if (plan.adjustment) {
                    value += *plan.adjustment;
                }
                return {DrawSource::Sampled, std::clamp(value, 0.0, 100.0)};
            } catch (const std::exception& e) {
                failure = e.what();
            }
        } else {
            failure = plan.generator_error;
        }
    }

    if (plan.actual) {
        return {DrawSource::Fallback, plan.actual};
    }
    return {DrawSource::Unavailable, std::nullopt};
}

} // anonymous namespace

// ============================================================================
// Simulation Implementation
// ============================================================================

SimulationResult run_simulation(const MeasurePanel& panel,
                                const ModelMap& models,
                                const ThresholdSet& thresholds,
                                const MeasureWeights& weights,
                                const std::string& organization_id,
                                int year,
                                const SimulationConfig& config,
                                const Adjustments& adjustments) {
    const ObservationRow& row = panel.get(organization_id, year);
    return run_simulation(row, models, thresholds, weights, config, adjustments);
}

SimulationResult run_simulation(const ObservationRow& row,
                                const ModelMap& models,
                                const ThresholdSet& thresholds,
                                const MeasureWeights& weights,
                                const SimulationConfig& config,
                                const Adjustments& adjustments) {
    SimulationResult result;
    result.draws_requested = config.n_draws;

    auto start_time = std::chrono::steady_clock::now();
    Logger& logger = Logger::get_instance();
    LogContext ctx(row.organization_id, row.year, "simulate");

    // Materialize per-measure inputs; nothing below mutates shared state
    std::vector<MeasurePlan> plans;
    plans.reserve(weights.size());
    for (const auto& [measure, weight] : weights.weights()) {
        MeasurePlan plan;
        plan.measure = measure;
        plan.actual = row.value(measure);

        if (thresholds.contains(measure)) {
            plan.table = &thresholds.get(measure);
        } else {
            logger.log_warning(ctx, "No thresholds for weighted measure " + measure +
                                    "; its rating is undefined");
        }

        auto model_it = models.find(measure);
        if (model_it != models.end() && model_it->second) {
            plan.modeled = true;
            try {
                plan.generator = model_it->second->conditional(row);
                if (!plan.generator) {
                    throw SamplingError("Model for " + measure + " returned no sampler");
                }
            } catch (const std::exception& e) {
                plan.generator_error = e.what();
                logger.log_warning(ctx, "Cannot build sampler for " + measure + ": " + e.what() +
                                        "; using observed value");
            }

            auto adj_it = adjustments.find(measure);
            if (adj_it != adjustments.end()) {
                plan.adjustment = adj_it->second;
            }
        }

        plans.push_back(std::move(plan));
    }

    const size_t n = config.n_draws;
    const size_t m = plans.size();

    std::vector<std::optional<double>> aggregates(n);
    std::vector<unsigned char> completed(n, 0);
    std::vector<unsigned char> source_grid(n * m, 0);
    std::vector<unsigned char> failure_grid(n * m, 0);
    std::vector<MeasureDraw> value_grid;
    if (config.store_draws) {
        value_grid.resize(n * m, MeasureDraw{DrawSource::Unavailable, std::nullopt});
    }

    std::vector<std::atomic<size_t>> failure_logs(m);
    for (auto& count : failure_logs) {
        count.store(0);
    }
    const size_t max_failure_logs = logger.max_sampling_warnings();

    std::atomic<bool> stop(false);
    auto out_of_time = [&]() {
        if (config.time_budget_ms <= 0.0) {
            return false;
        }
        double elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_time).count();
        return elapsed >= config.time_budget_ms;
    };

    auto run_draw = [&](size_t i) {
        if (stop.load(std::memory_order_relaxed)) {
            return;
        }
        if ((config.cancel != nullptr && config.cancel->load(std::memory_order_relaxed)) || out_of_time()) {
            stop.store(true, std::memory_order_relaxed);
            return;
        }

        try {
            std::mt19937_64 rng = make_draw_rng(config.seed, i);
            RatingMap ratings;

            for (size_t j = 0; j < m; ++j) {
                const MeasurePlan& plan = plans[j];
                std::string failure;
                MeasureDraw draw = draw_measure(plan, rng, failure);

                if (!failure.empty()) {
                    failure_grid[i * m + j] = 1;
                    if (failure_logs[j].fetch_add(1) < max_failure_logs) {
                        logger.log_sampling_failure(ctx, plan.measure, i, failure);
                    }
                }

                std::optional<int> level;
                if (plan.table != nullptr && draw.value) {
                    try {
                        level = classify(*plan.table, draw.value).level;
                    } catch (const ScoreOutOfRange&) {
                        level = std::nullopt;
                    }
                }
                ratings[plan.measure] = level;

                source_grid[i * m + j] = static_cast<unsigned char>(draw.source);
                if (config.store_draws) {
                    value_grid[i * m + j] = draw;
                }
            }

            aggregates[i] = aggregate_rating(ratings, weights);
            completed[i] = 1;
        } catch (const std::exception& e) {
            logger.log_error(ctx, "Draw " + std::to_string(i) + " failed: " + e.what());
        }
    };

#ifdef HAVE_OPENMP
    // Draws are independent; each iteration writes only its own slots
    #pragma omp parallel for schedule(dynamic, 64)
    for (long i = 0; i < static_cast<long>(n); ++i) {
        run_draw(static_cast<size_t>(i));
    }
#else
    for (size_t i = 0; i < n; ++i) {
        run_draw(i);
        if (stop.load(std::memory_order_relaxed)) {
            break;
        }
    }
#endif

    // Reduce in draw order
    std::vector<double> rated;
    rated.reserve(n);
    for (const auto& plan : plans) {
        result.sources[plan.measure] = SourceTally();
        if (config.store_draws) {
            result.measure_draws[plan.measure].reserve(n);
        }
    }

    for (size_t i = 0; i < n; ++i) {
        if (!completed[i]) {
            continue;
        }
        result.draws_completed++;
        result.simulated_ratings.push_back(aggregates[i]);
        if (aggregates[i]) {
            rated.push_back(*aggregates[i]);
        }

        for (size_t j = 0; j < m; ++j) {
            SourceTally& tally = result.sources[plans[j].measure];
            switch (static_cast<DrawSource>(source_grid[i * m + j])) {
                case DrawSource::Sampled: tally.sampled++; break;
                case DrawSource::Fallback: tally.fallback++; break;
                case DrawSource::Unavailable: tally.unavailable++; break;
            }
            if (failure_grid[i * m + j]) {
                tally.sampling_failures++;
                result.sampling_failures++;
            }
            if (config.store_draws) {
                result.measure_draws[plans[j].measure].push_back(value_grid[i * m + j]);
            }
        }
    }

    result.draws_rated = rated.size();
    result.cancelled = stop.load() && result.draws_completed < n;
    result.expected_rating = calculate_mean(rated);
    result.std_dev = calculate_std_dev(rated, result.expected_rating);
    result.distribution = RatingDistribution::from_ratings(rated, config.bins);

    auto end_time = std::chrono::steady_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    SimulationLogSummary summary;
    summary.draws_requested = result.draws_requested;
    summary.draws_completed = result.draws_completed;
    summary.draws_rated = result.draws_rated;
    summary.sampling_failures = result.sampling_failures;
    summary.expected_rating = result.expected_rating;
    summary.std_dev = result.std_dev;
    summary.execution_time_ms = result.execution_time_ms;
    summary.cancelled = result.cancelled;
    logger.log_simulation_complete(ctx, summary);

    return result;
}

} // namespace starcast
