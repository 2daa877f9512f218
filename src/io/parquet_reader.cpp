#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace fairvalue {

#ifdef HAVE_ARROW

namespace {

CellValue cell_from_array(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) {
        return CellValue{};
    }
    switch (array.type_id()) {
        case arrow::Type::DOUBLE:
            return CellValue{static_cast<const arrow::DoubleArray&>(array).Value(i)};
        case arrow::Type::FLOAT:
            return CellValue{static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(i))};
        case arrow::Type::INT64:
            return CellValue{static_cast<double>(static_cast<const arrow::Int64Array&>(array).Value(i))};
        case arrow::Type::INT32:
            return CellValue{static_cast<double>(static_cast<const arrow::Int32Array&>(array).Value(i))};
        case arrow::Type::STRING:
            return parse_cell(static_cast<const arrow::StringArray&>(array).GetString(i));
        default:
            return CellValue{};
    }
}

} // anonymous namespace

StatementTable ParquetReader::load_statement(const std::string& filepath) {
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

    // Read entire table into memory
    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    auto schema = table->schema();
    std::vector<FieldLabel> columns;
    columns.reserve(static_cast<size_t>(schema->num_fields()));
    for (int col_idx = 0; col_idx < schema->num_fields(); ++col_idx) {
        columns.push_back(FieldLabel::parse(schema->field(col_idx)->name()));
    }

    StatementTable statement(std::move(columns));
    const int64_t num_rows = table->num_rows();
    const size_t num_cols = static_cast<size_t>(schema->num_fields());

    std::vector<std::vector<CellValue>> rows(static_cast<size_t>(num_rows),
                                             std::vector<CellValue>(num_cols));

    // Walk every chunk of every column
    for (size_t col = 0; col < num_cols; ++col) {
        auto chunked = table->column(static_cast<int>(col));
        int64_t offset = 0;
        for (int c = 0; c < chunked->num_chunks(); ++c) {
            const auto& chunk = *chunked->chunk(c);
            for (int64_t i = 0; i < chunk.length(); ++i) {
                rows[static_cast<size_t>(offset + i)][col] = cell_from_array(chunk, i);
            }
            offset += chunk.length();
        }
    }

    for (auto& row : rows) {
        statement.add_row(std::move(row));
    }

    return statement;
}

#else // !HAVE_ARROW

StatementTable ParquetReader::load_statement(const std::string& filepath) {
    (void)filepath;  // Suppress unused parameter warning
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace fairvalue
