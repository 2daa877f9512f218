#ifndef FAIRVALUE_PARQUET_READER_HPP
#define FAIRVALUE_PARQUET_READER_HPP

#include "../statement.hpp"
#include <string>

namespace fairvalue {

class ParquetReader {
public:
    /**
     * Load one financial statement from a Parquet file.
     *
     * Every column becomes a statement column; a column named
     * "category::label" becomes a two-level label. Supported column types:
     *   - float64 / float32
     *   - int64 / int32
     *   - utf8 string (kept as text, coerced later by the field resolver)
     * Nulls and columns of other types become missing cells.
     * Row order is preserved (expected most recent period first).
     *
     * @param filepath Path to Parquet file
     * @return StatementTable containing all rows
     * @throws std::runtime_error if the file cannot be read, or if the build
     *         has no Arrow support
     */
    static StatementTable load_statement(const std::string& filepath);
};

} // namespace fairvalue

#endif // FAIRVALUE_PARQUET_READER_HPP
