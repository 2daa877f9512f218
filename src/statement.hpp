#ifndef FAIRVALUE_STATEMENT_HPP
#define FAIRVALUE_STATEMENT_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fairvalue {

// Column label of a statement table.
// Vendors expose some tables with two-level headers (category, label), e.g.
// ("Valuation Metrics", "EPS (VND)"); single-level tables leave category empty.
struct FieldLabel {
    std::string category;
    std::string name;

    FieldLabel() = default;
    FieldLabel(std::string label_name);
    FieldLabel(std::string label_category, std::string label_name);

    bool is_nested() const { return !category.empty(); }

    // "category::name" for nested labels, "name" otherwise
    std::string to_string() const;

    // Inverse of to_string()
    static FieldLabel parse(const std::string& text);

    bool operator==(const FieldLabel& other) const;
};

// Separator used when a two-level label is flattened into one string
constexpr const char* LABEL_SEPARATOR = "::";

// A single statement cell: missing, numeric or text as delivered by the vendor
using CellValue = std::variant<std::monostate, double, std::string>;

inline bool is_missing(const CellValue& v) { return std::holds_alternative<std::monostate>(v); }

// Parse a raw text cell: empty -> missing, full numeric parse -> double, otherwise text
CellValue parse_cell(const std::string& text);

// StatementTable: one financial statement, one row per reporting period.
// Rows are ordered most recent first. All rows share the table's column schema.
class StatementTable {
public:
    StatementTable() = default;
    explicit StatementTable(std::vector<FieldLabel> columns);

    // Append a column; existing rows receive a missing cell
    size_t add_column(const FieldLabel& label);

    // Append a period row. Throws std::invalid_argument if the width differs
    // from the column count.
    void add_row(std::vector<CellValue> row);

    size_t column_count() const { return columns_.size(); }
    size_t period_count() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    const std::vector<FieldLabel>& columns() const { return columns_; }
    const FieldLabel& column(size_t index) const;

    // Index of the column whose label equals `label` exactly, if any
    std::optional<size_t> find_column(const FieldLabel& label) const;

    const CellValue& cell(size_t row, size_t column) const;
    const std::vector<CellValue>& row(size_t index) const;

    // Re-sort rows most recent first by a numeric year column and an optional
    // sub-period (quarter) column. Rows whose period cannot be read sort last.
    // Throws std::invalid_argument if year_label is not a column.
    void order_by_period(const FieldLabel& year_label,
                         const std::optional<FieldLabel>& sub_period_label = std::nullopt);

    // Loaders. load() dispatches on extension: .csv, .json or .parquet
    static StatementTable load(const std::string& filepath);
    static StatementTable load_from_csv(const std::string& filepath);
    static StatementTable load_from_csv(std::istream& is);
    static StatementTable load_from_json(const std::string& filepath);
    static StatementTable load_from_json(std::istream& is);
    static StatementTable load_from_parquet(const std::string& filepath);

private:
    std::vector<FieldLabel> columns_;
    std::vector<std::vector<CellValue>> rows_;
};

enum class StatementKind : uint8_t {
    BalanceSheet = 0,
    IncomeStatement = 1,
    CashFlow = 2,
    Ratios = 3
};

std::string statement_kind_to_string(StatementKind kind);
StatementKind statement_kind_from_string(const std::string& text);

enum class ReportingFrequency : uint8_t {
    Annual = 0,
    Quarterly = 1
};

std::string frequency_to_string(ReportingFrequency frequency);
ReportingFrequency frequency_from_string(const std::string& text);

// The four statements supplied for one valuation request
struct StatementSet {
    StatementTable balance_sheet;
    StatementTable income_statement;
    StatementTable cash_flow;
    StatementTable ratios;
    ReportingFrequency frequency = ReportingFrequency::Annual;

    const StatementTable& get(StatementKind kind) const;
    StatementTable& get(StatementKind kind);

    // True when no statement has a single period row
    bool empty() const;
};

// Quote and share data supplied alongside the statements (company overview /
// price board). Values present here take precedence over the ratio table.
struct MarketData {
    std::string symbol;
    std::optional<double> current_price;
    std::optional<double> shares_outstanding;
};

} // namespace fairvalue

#endif // FAIRVALUE_STATEMENT_HPP
