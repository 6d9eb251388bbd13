#ifndef STARCAST_MODEL_FITTING_HPP
#define STARCAST_MODEL_FITTING_HPP

#include "distribution_model.hpp"
#include "measure_panel.hpp"
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace starcast {

using ModelMap = std::map<std::string, std::shared_ptr<const DistributionModel>>;

// Measure left unmodeled for lack of history (not an error)
struct InsufficientHistory {
    std::string measure;
    size_t observations;
    size_t required;
};

struct FitFailure {
    std::string measure;
    std::string message;
};

// Outcome of a fitting batch. Every requested measure lands in exactly one
// of models, skipped or failures.
struct FitReport {
    ModelMap models;
    std::vector<InsufficientHistory> skipped;
    std::vector<FitFailure> failures;
    double execution_time_ms;

    FitReport();

    bool has_model(const std::string& measure) const;
    // nullptr when the measure is unmodeled
    std::shared_ptr<const DistributionModel> model(const std::string& measure) const;
};

// Fit one beta regression per measure against its trend features. Rows must
// already carry derived trend features. Measures are independent and fitted
// in parallel when OpenMP is available; the batch always completes.
FitReport fit_models(const MeasurePanel& panel,
                     const std::vector<std::string>& measure_keys,
                     const FitConfig& config = FitConfig());

struct ModelCacheStats {
    size_t hits;
    size_t misses;
    size_t evictions;
    size_t entries_count;
};

// LRU memo of fitting batches keyed by panel fingerprint, measure list and
// fit configuration. Thread-safe.
class ModelCache {
public:
    explicit ModelCache(size_t max_entries = 8);

    // nullptr on a miss
    std::shared_ptr<const FitReport> get(uint64_t panel_version,
                                         const std::vector<std::string>& measure_keys,
                                         const FitConfig& config);

    void put(uint64_t panel_version,
             const std::vector<std::string>& measure_keys,
             const FitConfig& config,
             std::shared_ptr<const FitReport> report);

    // Cached report for the panel's current version, fitting on a miss
    std::shared_ptr<const FitReport> get_or_fit(const MeasurePanel& panel,
                                                const std::vector<std::string>& measure_keys,
                                                const FitConfig& config = FitConfig());

    ModelCacheStats get_stats() const;
    size_t size() const;
    void clear();

private:
    static std::string make_key(uint64_t panel_version,
                                const std::vector<std::string>& measure_keys,
                                const FitConfig& config);
    void update_lru(const std::string& key);
    void evict_lru();

    size_t max_entries_;
    mutable std::mutex mutex_;

    std::list<std::string> lru_list_;
    std::map<std::string, std::list<std::string>::iterator> lru_map_;
    std::map<std::string, std::shared_ptr<const FitReport>> entries_;

    size_t hits_;
    size_t misses_;
    size_t evictions_;
};

} // namespace starcast

#endif // STARCAST_MODEL_FITTING_HPP
