#include "statement.hpp"
#include "io/csv_reader.hpp"
#include "io/parquet_reader.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using ordered_json = nlohmann::ordered_json;

namespace fairvalue {

// ============================================================================
// FieldLabel Implementation
// ============================================================================

FieldLabel::FieldLabel(std::string label_name)
    : category(), name(std::move(label_name)) {}

FieldLabel::FieldLabel(std::string label_category, std::string label_name)
    : category(std::move(label_category)), name(std::move(label_name)) {}

std::string FieldLabel::to_string() const {
    if (category.empty()) {
        return name;
    }
    return category + LABEL_SEPARATOR + name;
}

FieldLabel FieldLabel::parse(const std::string& text) {
    size_t pos = text.find(LABEL_SEPARATOR);
    if (pos == std::string::npos) {
        return FieldLabel(text);
    }
    return FieldLabel(text.substr(0, pos), text.substr(pos + 2));
}

bool FieldLabel::operator==(const FieldLabel& other) const {
    return category == other.category && name == other.name;
}

CellValue parse_cell(const std::string& text) {
    if (text.empty()) {
        return CellValue{};
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end != begin && *end == '\0' && std::isfinite(value)) {
        return CellValue{value};
    }
    return CellValue{text};
}

// ============================================================================
// StatementTable Implementation
// ============================================================================

StatementTable::StatementTable(std::vector<FieldLabel> columns)
    : columns_(std::move(columns)) {}

size_t StatementTable::add_column(const FieldLabel& label) {
    columns_.push_back(label);
    for (auto& row : rows_) {
        row.emplace_back();
    }
    return columns_.size() - 1;
}

void StatementTable::add_row(std::vector<CellValue> row) {
    if (row.size() != columns_.size()) {
        throw std::invalid_argument(
            "Row has " + std::to_string(row.size()) + " cells but table has " +
            std::to_string(columns_.size()) + " columns");
    }
    rows_.push_back(std::move(row));
}

const FieldLabel& StatementTable::column(size_t index) const {
    if (index >= columns_.size()) {
        throw std::out_of_range("Column index out of range");
    }
    return columns_[index];
}

std::optional<size_t> StatementTable::find_column(const FieldLabel& label) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == label) {
            return i;
        }
    }
    return std::nullopt;
}

const CellValue& StatementTable::cell(size_t row, size_t column) const {
    if (row >= rows_.size() || column >= columns_.size()) {
        throw std::out_of_range("Cell (" + std::to_string(row) + ", " +
                                std::to_string(column) + ") out of range");
    }
    return rows_[row][column];
}

const std::vector<CellValue>& StatementTable::row(size_t index) const {
    if (index >= rows_.size()) {
        throw std::out_of_range("Row index out of range");
    }
    return rows_[index];
}

namespace {

std::optional<double> period_number(const CellValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const std::string* s = std::get_if<std::string>(&value)) {
        CellValue parsed = parse_cell(*s);
        if (const double* d = std::get_if<double>(&parsed)) {
            return *d;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

void StatementTable::order_by_period(const FieldLabel& year_label,
                                     const std::optional<FieldLabel>& sub_period_label) {
    auto year_idx = find_column(year_label);
    if (!year_idx) {
        throw std::invalid_argument("Period column not found: " + year_label.to_string());
    }

    std::optional<size_t> sub_idx;
    if (sub_period_label) {
        sub_idx = find_column(*sub_period_label);
        if (!sub_idx) {
            throw std::invalid_argument("Period column not found: " + sub_period_label->to_string());
        }
    }

    auto key = [&](const std::vector<CellValue>& r) {
        auto year = period_number(r[*year_idx]);
        double sub = 0.0;
        if (sub_idx) {
            sub = period_number(r[*sub_idx]).value_or(0.0);
        }
        return std::make_pair(year, sub);
    };

    std::stable_sort(rows_.begin(), rows_.end(),
        [&](const std::vector<CellValue>& a, const std::vector<CellValue>& b) {
            auto ka = key(a);
            auto kb = key(b);
            if (!ka.first || !kb.first) {
                // Unreadable periods go last
                return ka.first.has_value() && !kb.first.has_value();
            }
            if (*ka.first != *kb.first) {
                return *ka.first > *kb.first;
            }
            return ka.second > kb.second;
        });
}

// ============================================================================
// Loaders
// ============================================================================

namespace {

std::string lowercase_extension(const std::string& filepath) {
    size_t dot = filepath.find_last_of('.');
    if (dot == std::string::npos) {
        return "";
    }
    std::string ext = filepath.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

CellValue json_to_cell(const ordered_json& value) {
    if (value.is_number()) {
        double d = value.get<double>();
        return std::isfinite(d) ? CellValue{d} : CellValue{};
    }
    if (value.is_string()) {
        std::string s = value.get<std::string>();
        return s.empty() ? CellValue{} : CellValue{s};
    }
    return CellValue{};
}

// Flatten one JSON row object into (label, cell) pairs. A nested object is a
// category whose members are the labels.
void flatten_json_row(const ordered_json& row,
                      std::vector<std::pair<FieldLabel, CellValue>>& out) {
    for (auto it = row.begin(); it != row.end(); ++it) {
        if (it.value().is_object()) {
            for (auto inner = it.value().begin(); inner != it.value().end(); ++inner) {
                out.emplace_back(FieldLabel(it.key(), inner.key()), json_to_cell(inner.value()));
            }
        } else {
            out.emplace_back(FieldLabel::parse(it.key()), json_to_cell(it.value()));
        }
    }
}

} // anonymous namespace

StatementTable StatementTable::load(const std::string& filepath) {
    std::string ext = lowercase_extension(filepath);
    if (ext == "csv") {
        return load_from_csv(filepath);
    }
    if (ext == "json") {
        return load_from_json(filepath);
    }
    if (ext == "parquet") {
        return load_from_parquet(filepath);
    }
    throw std::invalid_argument("Unsupported statement file type: " + filepath +
                                " (expected .csv, .json or .parquet)");
}

StatementTable StatementTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open statement file: " + filepath);
    }
    return load_from_csv(file);
}

StatementTable StatementTable::load_from_csv(std::istream& is) {
    StatementTable table;
    CsvReader reader(is);

    std::vector<std::string> header;
    while (header.empty() && reader.has_more()) {
        header = reader.read_row();
    }
    if (header.empty()) {
        return table;
    }

    for (const auto& label : header) {
        table.columns_.push_back(FieldLabel::parse(label));
    }

    size_t line_number = 1;
    while (reader.has_more()) {
        auto fields = reader.read_row();
        ++line_number;
        if (fields.empty()) continue;

        if (fields.size() > header.size()) {
            throw std::runtime_error("Statement CSV line " + std::to_string(line_number) +
                                     " has more fields than the header");
        }

        std::vector<CellValue> row;
        row.reserve(header.size());
        for (const auto& field : fields) {
            row.push_back(parse_cell(field));
        }
        row.resize(header.size());
        table.add_row(std::move(row));
    }

    return table;
}

StatementTable StatementTable::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open statement file: " + filepath);
    }
    return load_from_json(file);
}

StatementTable StatementTable::load_from_json(std::istream& is) {
    ordered_json j;
    try {
        is >> j;
    } catch (const ordered_json::exception& e) {
        throw std::runtime_error("Failed to parse statement JSON: " + std::string(e.what()));
    }

    // Accept either a bare array of rows or {"rows": [...]}
    const ordered_json* rows = &j;
    if (j.is_object() && j.contains("rows")) {
        rows = &j["rows"];
    }
    if (!rows->is_array()) {
        throw std::runtime_error("Statement JSON must be an array of period rows");
    }

    StatementTable table;
    for (const auto& row_json : *rows) {
        if (!row_json.is_object()) {
            throw std::runtime_error("Statement JSON rows must be objects");
        }

        std::vector<std::pair<FieldLabel, CellValue>> cells;
        flatten_json_row(row_json, cells);

        std::vector<CellValue> row(table.column_count());
        for (auto& [label, value] : cells) {
            auto idx = table.find_column(label);
            if (!idx) {
                idx = table.add_column(label);
                row.emplace_back();
            }
            row[*idx] = std::move(value);
        }
        table.add_row(std::move(row));
    }

    return table;
}

StatementTable StatementTable::load_from_parquet(const std::string& filepath) {
    return ParquetReader::load_statement(filepath);
}

// ============================================================================
// Enumerations
// ============================================================================

std::string statement_kind_to_string(StatementKind kind) {
    switch (kind) {
        case StatementKind::BalanceSheet: return "balance_sheet";
        case StatementKind::IncomeStatement: return "income_statement";
        case StatementKind::CashFlow: return "cash_flow";
        case StatementKind::Ratios: return "ratios";
    }
    return "unknown";
}

StatementKind statement_kind_from_string(const std::string& text) {
    if (text == "balance_sheet") return StatementKind::BalanceSheet;
    if (text == "income_statement") return StatementKind::IncomeStatement;
    if (text == "cash_flow") return StatementKind::CashFlow;
    if (text == "ratios") return StatementKind::Ratios;
    throw std::invalid_argument("Unknown statement kind: " + text);
}

std::string frequency_to_string(ReportingFrequency frequency) {
    return frequency == ReportingFrequency::Quarterly ? "quarter" : "year";
}

ReportingFrequency frequency_from_string(const std::string& text) {
    if (text == "year" || text == "annual") return ReportingFrequency::Annual;
    if (text == "quarter" || text == "quarterly") return ReportingFrequency::Quarterly;
    throw std::invalid_argument("Unknown reporting frequency: " + text +
                                " (expected year or quarter)");
}

// ============================================================================
// StatementSet Implementation
// ============================================================================

const StatementTable& StatementSet::get(StatementKind kind) const {
    switch (kind) {
        case StatementKind::BalanceSheet: return balance_sheet;
        case StatementKind::IncomeStatement: return income_statement;
        case StatementKind::CashFlow: return cash_flow;
        case StatementKind::Ratios: return ratios;
    }
    throw std::invalid_argument("Unknown statement kind");
}

StatementTable& StatementSet::get(StatementKind kind) {
    return const_cast<StatementTable&>(static_cast<const StatementSet&>(*this).get(kind));
}

bool StatementSet::empty() const {
    return balance_sheet.empty() && income_statement.empty() &&
           cash_flow.empty() && ratios.empty();
}

} // namespace fairvalue
