#include "measure_panel.hpp"
#include "thresholds.hpp"
#include "io/csv_reader.hpp"
#include "io/parquet_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fstream>

namespace starcast {

// ============================================================================
// ObservationRow Implementation
// ============================================================================

ObservationRow::ObservationRow() : organization_id(""), year(0) {}

ObservationRow::ObservationRow(std::string org, int y)
    : organization_id(std::move(org)), year(y) {}

std::optional<double> ObservationRow::value(const std::string& measure) const {
    auto it = values.find(measure);
    if (it == values.end()) {
        return std::nullopt;
    }
    if (it->second && !std::isfinite(*it->second)) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> ObservationRow::feature(const std::string& name) const {
    auto it = features.find(name);
    if (it == features.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> trend_feature_names(const std::string& measure) {
    return {
        measure + " [lag1]",
        measure + " [diff1]",
        measure + " [diff2]",
        measure + " [lag1 missing]",
        measure + " [diff1 missing]",
        measure + " [diff2 missing]",
    };
}

// ============================================================================
// MeasurePanel Implementation
// ============================================================================

namespace {

bool row_less(const ObservationRow& a, const ObservationRow& b) {
    if (a.organization_id != b.organization_id) {
        return a.organization_id < b.organization_id;
    }
    return a.year < b.year;
}

// FNV-1a, enough to tell panel versions apart
void hash_bytes(uint64_t& h, const void* data, size_t len) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < len; ++i) {
        h ^= bytes[i];
        h *= 1099511628211ULL;
    }
}

void hash_string(uint64_t& h, const std::string& s) {
    hash_bytes(h, s.data(), s.size());
    hash_bytes(h, "\0", 1);
}

void hash_double(uint64_t& h, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    hash_bytes(h, &bits, sizeof(bits));
}

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

void MeasurePanel::add(ObservationRow row) {
    auto pos = std::lower_bound(rows_.begin(), rows_.end(), row, row_less);
    if (pos != rows_.end() && pos->organization_id == row.organization_id && pos->year == row.year) {
        throw std::invalid_argument("Duplicate panel row for organization " + row.organization_id +
                                    " in year " + std::to_string(row.year));
    }

    // NaN and infinite scores are missing, never values
    for (auto& [measure, value] : row.values) {
        if (value && !std::isfinite(*value)) {
            value = std::nullopt;
        }
        if (std::find(measure_keys_.begin(), measure_keys_.end(), measure) == measure_keys_.end()) {
            measure_keys_.push_back(measure);
        }
    }

    rows_.insert(pos, std::move(row));
}

const ObservationRow* MeasurePanel::find(const std::string& organization_id, int year) const {
    ObservationRow probe(organization_id, year);
    auto pos = std::lower_bound(rows_.begin(), rows_.end(), probe, row_less);
    if (pos != rows_.end() && pos->organization_id == organization_id && pos->year == year) {
        return &*pos;
    }
    return nullptr;
}

const ObservationRow& MeasurePanel::get(const std::string& organization_id, int year) const {
    const ObservationRow* row = find(organization_id, year);
    if (row == nullptr) {
        throw NoDataForContractYear(organization_id, year);
    }
    return *row;
}

size_t MeasurePanel::observation_count(const std::string& measure) const {
    size_t count = 0;
    for (const auto& row : rows_) {
        if (row.value(measure)) {
            ++count;
        }
    }
    return count;
}

void MeasurePanel::derive_trend_features(const std::vector<std::string>& measures) {
    const std::vector<std::string>& targets = measures.empty() ? measure_keys_ : measures;

    // Rows are ordered by (organization, year), so each series is contiguous
    size_t start = 0;
    while (start < rows_.size()) {
        size_t end = start;
        while (end < rows_.size() && rows_[end].organization_id == rows_[start].organization_id) {
            ++end;
        }

        for (const auto& measure : targets) {
            const auto names = trend_feature_names(measure);

            for (size_t k = start; k < end; ++k) {
                auto at = [&](size_t back) -> std::optional<double> {
                    if (k < start + back) return std::nullopt;
                    return rows_[k - back].value(measure);
                };

                std::optional<double> lag1 = at(1);
                std::optional<double> lag2 = at(2);
                std::optional<double> lag3 = at(3);

                std::optional<double> diff1;
                if (lag1 && lag2) diff1 = *lag1 - *lag2;
                std::optional<double> diff2;
                if (lag1 && lag3) diff2 = *lag1 - *lag3;

                auto& features = rows_[k].features;
                features[names[0]] = lag1.value_or(0.0);
                features[names[1]] = diff1.value_or(0.0);
                features[names[2]] = diff2.value_or(0.0);
                features[names[3]] = lag1 ? 0.0 : 1.0;
                features[names[4]] = diff1 ? 0.0 : 1.0;
                features[names[5]] = diff2 ? 0.0 : 1.0;
            }
        }

        start = end;
    }
}

uint64_t MeasurePanel::version() const {
    uint64_t h = 14695981039346656037ULL;
    for (const auto& row : rows_) {
        hash_string(h, row.organization_id);
        hash_bytes(h, &row.year, sizeof(row.year));
        for (const auto& [measure, value] : row.values) {
            hash_string(h, measure);
            if (value) {
                hash_double(h, *value);
            } else {
                hash_bytes(h, "missing", 7);
            }
        }
        for (const auto& [name, value] : row.features) {
            hash_string(h, name);
            hash_double(h, value);
        }
    }
    return h;
}

MeasurePanel MeasurePanel::load_from_csv(const std::string& filepath,
                                         bool normalize_keys,
                                         const std::string& measure_prefix) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open panel file: " + filepath);
    }
    return load_from_csv(file, normalize_keys, measure_prefix);
}

MeasurePanel MeasurePanel::load_from_csv(std::istream& is,
                                         bool normalize_keys,
                                         const std::string& measure_prefix) {
    MeasurePanel panel;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return panel;
    }

    int org_idx = -1;
    int year_idx = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = lower_copy(header[i]);
        if (org_idx < 0 && (name == "organization_id" || name == "contract_id")) {
            org_idx = static_cast<int>(i);
        } else if (year_idx < 0 && name == "year") {
            year_idx = static_cast<int>(i);
        }
    }
    if (org_idx < 0 || year_idx < 0) {
        throw std::runtime_error("Panel CSV requires organization_id (or CONTRACT_ID) and year columns");
    }

    // Column index -> measure key
    std::vector<std::pair<size_t, std::string>> measure_columns;
    for (size_t i = 0; i < header.size(); ++i) {
        if (static_cast<int>(i) == org_idx || static_cast<int>(i) == year_idx) continue;
        std::string key = normalize_keys ? normalize_measure_key(header[i]) : header[i];
        if (!measure_prefix.empty() && key.rfind(measure_prefix, 0) != 0) continue;
        measure_columns.emplace_back(i, key);
    }

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        if (row.size() <= static_cast<size_t>(std::max(org_idx, year_idx))) {
            throw std::runtime_error("Panel CSV row " + std::to_string(reader.rows_read()) +
                                     " is missing organization or year");
        }

        auto year = CsvReader::parse_number(row[year_idx]);
        if (!year) {
            throw std::runtime_error("Panel CSV row " + std::to_string(reader.rows_read()) +
                                     " has a non-numeric year: " + row[year_idx]);
        }

        ObservationRow obs(row[org_idx], static_cast<int>(*year));
        for (const auto& [col, key] : measure_columns) {
            obs.values[key] = col < row.size() ? CsvReader::parse_number(row[col]) : std::nullopt;
        }
        panel.add(std::move(obs));
    }

    return panel;
}

MeasurePanel MeasurePanel::load_from_parquet(const std::string& filepath) {
    return ParquetReader::load_panel(filepath);
}

} // namespace starcast
