#ifndef STARCAST_THRESHOLDS_HPP
#define STARCAST_THRESHOLDS_HPP

#include <cmath>
#include <istream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace starcast {

constexpr int MIN_RATING_LEVEL = 1;
constexpr int MAX_RATING_LEVEL = 5;

// Measure key has no threshold table (or no weight, for weight lookups)
class UnknownMeasure : public std::runtime_error {
public:
    explicit UnknownMeasure(const std::string& measure)
        : std::runtime_error("Unknown measure: " + measure), measure_(measure) {}

    const std::string& measure() const { return measure_; }

private:
    std::string measure_;
};

// No band of the measure's table contains the score
class ScoreOutOfRange : public std::runtime_error {
public:
    ScoreOutOfRange(const std::string& measure, double score)
        : std::runtime_error("Score " + std::to_string(score) +
                             " does not fall into any defined range for measure " + measure),
          measure_(measure), score_(score) {}

    const std::string& measure() const { return measure_; }
    double score() const { return score_; }

private:
    std::string measure_;
    double score_;
};

// A cutpoint cell could not be turned into numeric bounds
class ThresholdParseError : public std::runtime_error {
public:
    explicit ThresholdParseError(const std::string& message)
        : std::runtime_error(message) {}
};

// Half-open interval [lower, upper) mapped to a rating level.
// Open-ended bands use +/- infinity.
struct ThresholdBand {
    double lower;
    double upper;
    int level;

    ThresholdBand();
    ThresholdBand(double lo, double hi, int lvl);

    bool contains(double score) const { return lower <= score && score < upper; }
    bool operator==(const ThresholdBand& other) const;
};

// Classification of one score against one measure's bands.
// Both fields are empty for a missing score.
struct Classification {
    std::optional<int> level;
    std::optional<double> distance_to_next;

    bool defined() const { return level.has_value(); }
};

// Immutable, level-ordered band list for one measure
class ThresholdTable {
public:
    ThresholdTable() = default;
    ThresholdTable(std::string measure, std::vector<ThresholdBand> bands);

    const std::string& measure() const { return measure_; }
    const std::vector<ThresholdBand>& bands() const { return bands_; }
    bool empty() const { return bands_.empty(); }

    // Band for a rating level, or nullptr if the table has none
    const ThresholdBand* band_for_level(int level) const;
    const ThresholdBand& highest_band() const;

    // True if the bands are gap-free, non-overlapping, strictly increasing in
    // level and together span (-inf, +inf)
    bool is_contiguous() const;

private:
    std::string measure_;
    std::vector<ThresholdBand> bands_;  // sorted by level
};

// All measures' tables keyed by normalized measure key
class ThresholdSet {
public:
    ThresholdSet() = default;

    void add(ThresholdTable table);

    bool contains(const std::string& measure) const;
    // Throws UnknownMeasure
    const ThresholdTable& get(const std::string& measure) const;
    size_t size() const { return tables_.size(); }
    bool empty() const { return tables_.empty(); }

    std::vector<std::string> measures() const;
    const std::map<std::string, ThresholdTable>& tables() const { return tables_; }

    // Load a cutpoint table: a header row of measure names (first column is
    // the row label) followed by "<n> star" rows whose cells hold band text.
    // Rows before the header are skipped with `preamble_rows`. Cells that fail
    // to parse are logged and skipped.
    static ThresholdSet load_from_csv(const std::string& filepath,
                                      size_t preamble_rows = 0,
                                      bool normalize_keys = true);
    static ThresholdSet load_from_csv(std::istream& is,
                                      size_t preamble_rows = 0,
                                      bool normalize_keys = true);

private:
    std::map<std::string, ThresholdTable> tables_;
};

// Collapse "C01: Breast Cancer Screening" to "C: Breast Cancer Screening".
// Keys without a colon are returned unchanged.
std::string normalize_measure_key(const std::string& key);

// Parse band text such as ">= 53 % to < 67 %", "< 53 %", ">= 85 %" into
// (lower, upper). Throws ThresholdParseError on unrecognized text.
std::pair<double, double> parse_threshold(const std::string& text);

// Classify a score against one table. A missing or NaN score yields an
// undefined classification. Throws ScoreOutOfRange.
Classification classify(const ThresholdTable& table, std::optional<double> score);

// Look up the measure and classify. Throws UnknownMeasure, ScoreOutOfRange.
Classification classify(const std::string& measure,
                        std::optional<double> score,
                        const ThresholdSet& thresholds);

} // namespace starcast

#endif // STARCAST_THRESHOLDS_HPP
