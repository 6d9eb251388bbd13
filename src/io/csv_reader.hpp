#ifndef STARCAST_CSV_READER_HPP
#define STARCAST_CSV_READER_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace starcast {

// Line-oriented CSV reader. Handles double-quoted cells so measure names
// such as "C01: Breast Cancer Screening, Ages 50-74" survive intact.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // Discard the next `count` lines (cutpoint exports carry a preamble)
    void skip_rows(size_t count);

    size_t rows_read() const { return rows_read_; }

    // Parse a numeric cell; empty, "NA" or non-numeric text yields nullopt.
    // Trailing '%' is accepted.
    static std::optional<double> parse_number(const std::string& cell);

private:
    std::istream& is_;
    char delimiter_;
    size_t rows_read_;

    static std::string trim(const std::string& s);
};

} // namespace starcast

#endif // STARCAST_CSV_READER_HPP
