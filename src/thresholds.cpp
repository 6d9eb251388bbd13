#include "thresholds.hpp"
#include "logger.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <regex>

namespace starcast {

// ============================================================================
// ThresholdBand Implementation
// ============================================================================

ThresholdBand::ThresholdBand() : lower(0.0), upper(0.0), level(MIN_RATING_LEVEL) {}

ThresholdBand::ThresholdBand(double lo, double hi, int lvl)
    : lower(lo), upper(hi), level(lvl) {}

bool ThresholdBand::operator==(const ThresholdBand& other) const {
    return lower == other.lower && upper == other.upper && level == other.level;
}

// ============================================================================
// ThresholdTable Implementation
// ============================================================================

ThresholdTable::ThresholdTable(std::string measure, std::vector<ThresholdBand> bands)
    : measure_(std::move(measure)), bands_(std::move(bands)) {
    for (const auto& band : bands_) {
        if (band.level < MIN_RATING_LEVEL || band.level > MAX_RATING_LEVEL) {
            throw std::invalid_argument("Rating level " + std::to_string(band.level) +
                                        " out of range for measure " + measure_);
        }
        if (std::isnan(band.lower) || std::isnan(band.upper) || band.lower > band.upper) {
            throw std::invalid_argument("Invalid band bounds for measure " + measure_);
        }
    }

    std::stable_sort(bands_.begin(), bands_.end(),
                     [](const ThresholdBand& a, const ThresholdBand& b) { return a.level < b.level; });

    for (size_t i = 1; i < bands_.size(); ++i) {
        if (bands_[i].level == bands_[i - 1].level) {
            throw std::invalid_argument("Duplicate rating level " + std::to_string(bands_[i].level) +
                                        " for measure " + measure_);
        }
    }
}

const ThresholdBand* ThresholdTable::band_for_level(int level) const {
    for (const auto& band : bands_) {
        if (band.level == level) {
            return &band;
        }
    }
    return nullptr;
}

const ThresholdBand& ThresholdTable::highest_band() const {
    if (bands_.empty()) {
        throw std::out_of_range("Threshold table for " + measure_ + " has no bands");
    }
    return bands_.back();
}

bool ThresholdTable::is_contiguous() const {
    if (bands_.empty()) {
        return false;
    }
    const double inf = std::numeric_limits<double>::infinity();
    if (bands_.front().lower != -inf || bands_.back().upper != inf) {
        return false;
    }
    for (size_t i = 1; i < bands_.size(); ++i) {
        if (bands_[i].level <= bands_[i - 1].level) return false;
        if (bands_[i].lower != bands_[i - 1].upper) return false;
    }
    return true;
}

// ============================================================================
// ThresholdSet Implementation
// ============================================================================

void ThresholdSet::add(ThresholdTable table) {
    std::string key = table.measure();
    tables_[key] = std::move(table);
}

bool ThresholdSet::contains(const std::string& measure) const {
    return tables_.find(measure) != tables_.end();
}

const ThresholdTable& ThresholdSet::get(const std::string& measure) const {
    auto it = tables_.find(measure);
    if (it == tables_.end()) {
        throw UnknownMeasure(measure);
    }
    return it->second;
}

std::vector<std::string> ThresholdSet::measures() const {
    std::vector<std::string> keys;
    keys.reserve(tables_.size());
    for (const auto& [key, table] : tables_) {
        keys.push_back(key);
    }
    return keys;
}

ThresholdSet ThresholdSet::load_from_csv(const std::string& filepath,
                                         size_t preamble_rows,
                                         bool normalize_keys) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open cutpoint file: " + filepath);
    }
    return load_from_csv(file, preamble_rows, normalize_keys);
}

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string strip(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// "1 star", "5star", "3 Stars" -> level; nullopt for any other label
std::optional<int> parse_star_label(const std::string& label) {
    std::string lower = to_lower(label);
    auto pos = lower.find("star");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string digits = strip(lower.substr(0, pos));
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoi(digits);
}

double first_bound(const std::string& text, const std::regex& pattern) {
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        throw ThresholdParseError("Could not parse threshold: " + text);
    }
    return std::stod(match[1].str());
}

} // anonymous namespace

ThresholdSet ThresholdSet::load_from_csv(std::istream& is,
                                         size_t preamble_rows,
                                         bool normalize_keys) {
    ThresholdSet set;
    CsvReader reader(is);
    reader.skip_rows(preamble_rows);

    auto header = reader.read_row();
    if (header.size() < 2) {
        throw std::runtime_error("Cutpoint CSV requires a header row of measure names");
    }

    std::vector<std::vector<ThresholdBand>> bands(header.size());

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        auto level = parse_star_label(row[0]);
        if (!level) continue;

        for (size_t col = 1; col < row.size() && col < header.size(); ++col) {
            const std::string& cell = row[col];
            if (cell.empty()) continue;

            if (*level < MIN_RATING_LEVEL || *level > MAX_RATING_LEVEL) {
                Logger::get_instance().log_threshold_skipped(
                    header[col], cell, "rating level " + std::to_string(*level) + " out of range");
                continue;
            }

            try {
                auto bounds = parse_threshold(cell);
                bands[col].emplace_back(bounds.first, bounds.second, *level);
            } catch (const ThresholdParseError& e) {
                Logger::get_instance().log_threshold_skipped(header[col], cell, e.what());
            }
        }
    }

    for (size_t col = 1; col < header.size(); ++col) {
        if (bands[col].empty() || header[col].empty()) continue;

        std::string key = normalize_keys ? normalize_measure_key(header[col]) : header[col];
        if (set.contains(key)) {
            Logger::get_instance().log_warning(
                LogContext(), "Duplicate threshold measure after normalization: " + key);
        }
        try {
            set.add(ThresholdTable(key, bands[col]));
        } catch (const std::invalid_argument& e) {
            Logger::get_instance().log_threshold_skipped(header[col], "", e.what());
        }
    }

    return set;
}

// ============================================================================
// Free Functions
// ============================================================================

std::string normalize_measure_key(const std::string& key) {
    auto colon = key.find(':');
    if (colon == std::string::npos || colon == 0) {
        return key;
    }
    return key.substr(0, 1) + key.substr(colon);
}

std::pair<double, double> parse_threshold(const std::string& text) {
    static const std::regex lower_pattern(R"(>=?\s*(-?\d+\.?\d*))");
    static const std::regex upper_pattern(R"(<=?\s*(-?\d+\.?\d*))");
    const double inf = std::numeric_limits<double>::infinity();

    std::string cleaned;
    for (char c : text) {
        if (c != '%') cleaned += c;
    }
    cleaned = strip(cleaned);

    auto to_pos = cleaned.find("to");
    if (to_pos != std::string::npos) {
        double lower = first_bound(cleaned.substr(0, to_pos), lower_pattern);
        double upper = first_bound(cleaned.substr(to_pos + 2), upper_pattern);
        return {lower, upper};
    }
    if (cleaned.rfind("<", 0) == 0) {
        return {-inf, first_bound(cleaned, upper_pattern)};
    }
    if (cleaned.rfind(">", 0) == 0) {
        return {first_bound(cleaned, lower_pattern), inf};
    }
    if (cleaned.rfind("100", 0) == 0) {
        return {100.0, 100.0};
    }
    throw ThresholdParseError("Unexpected threshold format: " + text);
}

Classification classify(const ThresholdTable& table, std::optional<double> score) {
    Classification result;
    if (!score || std::isnan(*score)) {
        return result;
    }
    const double s = *score;

    if (table.empty()) {
        throw ScoreOutOfRange(table.measure(), s);
    }

    const ThresholdBand* match = nullptr;
    for (const auto& band : table.bands()) {
        if (band.contains(s)) {
            match = &band;
            break;
        }
    }

    // Top band rescue: scores at the open upper edge of the highest band
    if (match == nullptr && s >= table.highest_band().lower) {
        match = &table.highest_band();
    }

    if (match == nullptr) {
        throw ScoreOutOfRange(table.measure(), s);
    }

    result.level = match->level;
    if (match->level >= MAX_RATING_LEVEL) {
        result.distance_to_next = 0.0;
    } else if (const ThresholdBand* next = table.band_for_level(match->level + 1)) {
        result.distance_to_next = std::abs(next->lower - s);
    }
    return result;
}

Classification classify(const std::string& measure,
                        std::optional<double> score,
                        const ThresholdSet& thresholds) {
    return classify(thresholds.get(measure), score);
}

} // namespace starcast
