#ifndef STARCAST_PARQUET_READER_HPP
#define STARCAST_PARQUET_READER_HPP

#include "../measure_panel.hpp"
#include <string>

namespace starcast {

class ParquetReader {
public:
    /**
     * Load a wide measure panel from a Parquet file.
     *
     * Expected schema:
     *   - organization_id (or CONTRACT_ID): string
     *   - year: any integer type
     *   - one numeric column per measure; nulls are missing observations
     *
     * Measure column names are normalized the same way as the CSV loader.
     *
     * @param filepath Path to Parquet file
     * @return MeasurePanel containing one row per (organization, year)
     * @throws std::runtime_error if file cannot be read or schema is invalid
     */
    static MeasurePanel load_panel(const std::string& filepath);
};

} // namespace starcast

#endif // STARCAST_PARQUET_READER_HPP
