#include "model_fitting.hpp"
#include "logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace starcast {

// ============================================================================
// FitReport Implementation
// ============================================================================

FitReport::FitReport() : execution_time_ms(0.0) {}

bool FitReport::has_model(const std::string& measure) const {
    return models.find(measure) != models.end();
}

std::shared_ptr<const DistributionModel> FitReport::model(const std::string& measure) const {
    auto it = models.find(measure);
    if (it == models.end()) {
        return nullptr;
    }
    return it->second;
}

// ============================================================================
// Batch fitting
// ============================================================================

namespace {

// Per-measure outcome slot, written by exactly one iteration
struct FitSlot {
    std::shared_ptr<const DistributionModel> model;
    bool skipped = false;
    size_t observations = 0;
    std::string error;
};

void fit_one(const MeasurePanel& panel, const std::string& measure,
             const FitConfig& config, FitSlot& slot) {
    slot.observations = panel.observation_count(measure);
    if (slot.observations < config.min_observations) {
        slot.skipped = true;
        return;
    }

    try {
        auto model = BetaRegressionModel::fit(panel, measure, config);
        Logger::get_instance().log_model_fitted(measure, model->observation_count(),
                                                static_cast<size_t>(model->iterations()),
                                                model->log_likelihood(),
                                                model->converged());
        slot.model = std::move(model);
    } catch (const std::exception& e) {
        slot.error = e.what();
    }
}

} // anonymous namespace

FitReport fit_models(const MeasurePanel& panel,
                     const std::vector<std::string>& measure_keys,
                     const FitConfig& config) {
    FitReport report;
    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<FitSlot> slots(measure_keys.size());

#ifdef HAVE_OPENMP
    // Measures share nothing mutable; each iteration owns its slot
    #pragma omp parallel for schedule(dynamic, 1)
    for (long i = 0; i < static_cast<long>(measure_keys.size()); ++i) {
        fit_one(panel, measure_keys[static_cast<size_t>(i)], config, slots[static_cast<size_t>(i)]);
    }
#else
    for (size_t i = 0; i < measure_keys.size(); ++i) {
        fit_one(panel, measure_keys[i], config, slots[i]);
    }
#endif

    Logger& logger = Logger::get_instance();
    for (size_t i = 0; i < measure_keys.size(); ++i) {
        const std::string& measure = measure_keys[i];
        FitSlot& slot = slots[i];

        if (slot.model) {
            report.models[measure] = std::move(slot.model);
        } else if (slot.skipped) {
            report.skipped.push_back({measure, slot.observations, config.min_observations});
            logger.log_model_skipped(measure, "insufficient history (" +
                                              std::to_string(slot.observations) + " of " +
                                              std::to_string(config.min_observations) +
                                              " observations)");
        } else {
            report.failures.push_back({measure, slot.error});
            logger.log_error(LogContext("", 0, "fit"), "Model fit failed for " + measure + ": " + slot.error);
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    report.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return report;
}

// ============================================================================
// ModelCache Implementation
// ============================================================================

ModelCache::ModelCache(size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries),
      hits_(0),
      misses_(0),
      evictions_(0) {}

std::string ModelCache::make_key(uint64_t panel_version,
                                 const std::vector<std::string>& measure_keys,
                                 const FitConfig& config) {
    std::ostringstream oss;
    oss << std::hex << panel_version << std::dec << '|'
        << config.min_observations << '|'
        << std::setprecision(17) << config.boundary_epsilon << '|'
        << config.max_iterations << '|'
        << config.tolerance << '|'
        << config.ridge_penalty;
    for (const auto& measure : measure_keys) {
        oss << '\x1f' << measure;
    }
    return oss.str();
}

std::shared_ptr<const FitReport> ModelCache::get(uint64_t panel_version,
                                                 const std::vector<std::string>& measure_keys,
                                                 const FitConfig& config) {
    std::string key = make_key(panel_version, measure_keys, config);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return nullptr;
    }

    hits_++;
    update_lru(key);
    return it->second;
}

void ModelCache::put(uint64_t panel_version,
                     const std::vector<std::string>& measure_keys,
                     const FitConfig& config,
                     std::shared_ptr<const FitReport> report) {
    std::string key = make_key(panel_version, measure_keys, config);
    std::lock_guard<std::mutex> lock(mutex_);

    entries_[key] = std::move(report);
    update_lru(key);
    evict_lru();
}

std::shared_ptr<const FitReport> ModelCache::get_or_fit(const MeasurePanel& panel,
                                                        const std::vector<std::string>& measure_keys,
                                                        const FitConfig& config) {
    const uint64_t version = panel.version();
    if (auto cached = get(version, measure_keys, config)) {
        return cached;
    }

    // Fit outside the lock; a concurrent miss on the same key fits twice
    auto report = std::make_shared<const FitReport>(fit_models(panel, measure_keys, config));
    put(version, measure_keys, config, report);
    return report;
}

ModelCacheStats ModelCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ModelCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.entries_count = entries_.size();
    return stats;
}

size_t ModelCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ModelCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_list_.clear();
    lru_map_.clear();
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
}

void ModelCache::update_lru(const std::string& key) {
    auto it = lru_map_.find(key);
    if (it != lru_map_.end()) {
        // Move to front
        lru_list_.erase(it->second);
    }
    lru_list_.push_front(key);
    lru_map_[key] = lru_list_.begin();
}

void ModelCache::evict_lru() {
    while (entries_.size() > max_entries_ && !lru_list_.empty()) {
        std::string key = lru_list_.back();
        lru_list_.pop_back();
        lru_map_.erase(key);
        entries_.erase(key);
        evictions_++;
    }
}

} // namespace starcast
