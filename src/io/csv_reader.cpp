#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace starcast {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), rows_read_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    if (!std::getline(is_, line)) {
        return row;
    }
    ++rows_read_;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::string cell;
    bool in_quotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                // "" inside a quoted cell is an escaped quote
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter_) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    row.push_back(trim(cell));

    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

void CsvReader::skip_rows(size_t count) {
    std::string line;
    for (size_t i = 0; i < count && std::getline(is_, line); ++i) {
        ++rows_read_;
    }
}

std::optional<double> CsvReader::parse_number(const std::string& cell) {
    std::string text = trim(cell);
    if (!text.empty() && text.back() == '%') {
        text.pop_back();
        text = trim(text);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    // "4 out of 5 stars" and friends are not numeric measure scores
    if (consumed != text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace starcast
