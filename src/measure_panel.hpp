#ifndef STARCAST_MEASURE_PANEL_HPP
#define STARCAST_MEASURE_PANEL_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace starcast {

// Requested organization/year has no row in the panel
class NoDataForContractYear : public std::runtime_error {
public:
    NoDataForContractYear(const std::string& organization_id, int year)
        : std::runtime_error("No data found for organization " + organization_id +
                             " in year " + std::to_string(year)),
          organization_id_(organization_id), year_(year) {}

    const std::string& organization_id() const { return organization_id_; }
    int year() const { return year_; }

private:
    std::string organization_id_;
    int year_;
};

// One (organization, year) observation. Measure values are optional so a
// missing score can never be mistaken for zero. Derived trend features are
// complete (missing inputs are imputed as 0 with an indicator set).
struct ObservationRow {
    std::string organization_id;
    int year;
    std::map<std::string, std::optional<double>> values;
    std::map<std::string, double> features;

    ObservationRow();
    ObservationRow(std::string org, int y);

    std::optional<double> value(const std::string& measure) const;
    std::optional<double> feature(const std::string& name) const;
};

// Names of the six trend features derived for a measure, in model order:
// lag1, diff1, diff2 and a missing indicator for each
std::vector<std::string> trend_feature_names(const std::string& measure);

// Historical panel of observation rows ordered by (organization, year)
class MeasurePanel {
public:
    MeasurePanel() = default;

    // Insert keeping (organization, year) order. Throws std::invalid_argument
    // on a duplicate key. New measure keys are appended to measure_keys().
    void add(ObservationRow row);

    const ObservationRow* find(const std::string& organization_id, int year) const;
    const ObservationRow& get(const std::string& organization_id, int year) const;  // throws NoDataForContractYear

    const std::vector<ObservationRow>& rows() const { return rows_; }
    const std::vector<std::string>& measure_keys() const { return measure_keys_; }
    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    // Number of rows with a non-missing value for the measure
    size_t observation_count(const std::string& measure) const;

    // Compute lag/diff features per organization series for the given
    // measures (all measure keys if empty)
    void derive_trend_features(const std::vector<std::string>& measures = {});

    // Content fingerprint; changes whenever values or features change
    uint64_t version() const;

    // CSV: an organization column ("organization_id" or "CONTRACT_ID"), a
    // "year" column, then one column per measure. Non-numeric cells are
    // missing. When `measure_prefix` is set only columns whose normalized
    // key starts with it are kept.
    static MeasurePanel load_from_csv(const std::string& filepath,
                                      bool normalize_keys = true,
                                      const std::string& measure_prefix = "");
    static MeasurePanel load_from_csv(std::istream& is,
                                      bool normalize_keys = true,
                                      const std::string& measure_prefix = "");

    static MeasurePanel load_from_parquet(const std::string& filepath);

private:
    std::vector<ObservationRow> rows_;
    std::vector<std::string> measure_keys_;
};

} // namespace starcast

#endif // STARCAST_MEASURE_PANEL_HPP
