#include "parquet_reader.hpp"
#include "../thresholds.hpp"
#include <cmath>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace starcast {

#ifdef HAVE_ARROW

namespace {

// Writers such as pandas store missing floats as NaN rather than null
std::optional<double> finite_or_missing(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

// Numeric cell as double; null, NaN or non-numeric types yield nullopt
std::optional<double> numeric_value(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) {
        return std::nullopt;
    }
    switch (array.type_id()) {
        case arrow::Type::DOUBLE:
            return finite_or_missing(static_cast<const arrow::DoubleArray&>(array).Value(i));
        case arrow::Type::FLOAT:
            return finite_or_missing(static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(i)));
        case arrow::Type::INT64:
            return static_cast<double>(static_cast<const arrow::Int64Array&>(array).Value(i));
        case arrow::Type::INT32:
            return static_cast<double>(static_cast<const arrow::Int32Array&>(array).Value(i));
        case arrow::Type::INT16:
            return static_cast<double>(static_cast<const arrow::Int16Array&>(array).Value(i));
        case arrow::Type::UINT16:
            return static_cast<double>(static_cast<const arrow::UInt16Array&>(array).Value(i));
        default:
            return std::nullopt;
    }
}

} // anonymous namespace

MeasurePanel ParquetReader::load_panel(const std::string& filepath) {
    MeasurePanel panel;

    // Open Parquet file
    auto infile_result = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    // Create Parquet reader
    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    // Read entire table into memory as a single chunk per column
    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    // Validate schema
    auto schema = table->schema();
    int org_idx = schema->GetFieldIndex("organization_id");
    if (org_idx < 0) {
        org_idx = schema->GetFieldIndex("CONTRACT_ID");
    }
    int year_idx = schema->GetFieldIndex("year");
    if (org_idx < 0 || year_idx < 0) {
        throw std::runtime_error("Parquet file missing required columns. Expected: organization_id (or CONTRACT_ID), year");
    }
    if (schema->field(org_idx)->type()->id() != arrow::Type::STRING) {
        throw std::runtime_error("Parquet column " + schema->field(org_idx)->name() + " must be a string");
    }

    int64_t num_rows = table->num_rows();
    if (num_rows == 0) {
        return panel;
    }

    auto org_column = std::static_pointer_cast<arrow::StringArray>(table->column(org_idx)->chunk(0));
    auto year_column = table->column(year_idx)->chunk(0);

    std::vector<std::pair<std::shared_ptr<arrow::Array>, std::string>> measure_columns;
    for (int col_idx = 0; col_idx < schema->num_fields(); ++col_idx) {
        if (col_idx == org_idx || col_idx == year_idx) {
            continue;
        }
        measure_columns.emplace_back(table->column(col_idx)->chunk(0),
                                     normalize_measure_key(schema->field(col_idx)->name()));
    }

    for (int64_t i = 0; i < num_rows; ++i) {
        auto year = numeric_value(*year_column, i);
        if (org_column->IsNull(i) || !year) {
            throw std::runtime_error("Parquet row " + std::to_string(i) + " is missing organization or year");
        }

        ObservationRow row(org_column->GetString(i), static_cast<int>(*year));
        for (const auto& [column, key] : measure_columns) {
            row.values[key] = numeric_value(*column, i);
        }
        panel.add(std::move(row));
    }

    return panel;
}

#else // !HAVE_ARROW

MeasurePanel ParquetReader::load_panel(const std::string& filepath) {
    (void)filepath;  // Suppress unused parameter warning
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace starcast
