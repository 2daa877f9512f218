#include "field_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace fairvalue {

namespace {

// ASCII case folding; bytes of multi-byte UTF-8 sequences are left as-is
std::string fold_case(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool text_matches(const std::string& candidate, const std::string& actual) {
    std::string a = fold_case(trim(candidate));
    std::string b = fold_case(trim(actual));
    if (a.empty() || b.empty()) {
        return false;
    }
    if (a == b) {
        return true;
    }
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;
    return shorter.size() >= MIN_CONTAINMENT_LENGTH &&
           longer.find(shorter) != std::string::npos;
}

std::optional<double> row_value(const StatementTable& table, size_t row,
                                const std::string& candidate) {
    for (size_t col = 0; col < table.column_count(); ++col) {
        if (!labels_match(candidate, table.column(col))) {
            continue;
        }
        auto value = coerce_numeric(table.cell(row, col));
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<double> first_candidate_value(const StatementTable& table, size_t row,
                                            const FieldCandidateList& candidates) {
    for (const auto& candidate : candidates) {
        auto value = row_value(table, row, candidate);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

bool labels_match(const std::string& candidate, const FieldLabel& label) {
    size_t sep = candidate.find(LABEL_SEPARATOR);
    if (sep == std::string::npos) {
        return text_matches(candidate, label.name);
    }
    return text_matches(candidate.substr(0, sep), label.category) &&
           text_matches(candidate.substr(sep + 2), label.name);
}

std::optional<double> coerce_numeric(const CellValue& value) {
    if (const double* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) {
            return std::nullopt;
        }
        return *d;
    }

    const std::string* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
        return std::nullopt;
    }

    std::string cleaned = trim(*text);
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ','), cleaned.end());
    if (cleaned.empty()) {
        return std::nullopt;
    }

    const char* begin = cleaned.c_str();
    char* end = nullptr;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<double> resolve(const StatementTable& table,
                              const FieldCandidateList& candidates,
                              AggregationMode mode) {
    if (table.empty() || candidates.empty()) {
        return std::nullopt;
    }

    if (mode == AggregationMode::Latest) {
        return first_candidate_value(table, 0, candidates);
    }

    // A partial window would understate an annualized figure
    if (table.period_count() < TRAILING_PERIODS) {
        return std::nullopt;
    }

    double total = 0.0;
    bool contributed = false;
    for (size_t row = 0; row < TRAILING_PERIODS; ++row) {
        auto value = first_candidate_value(table, row, candidates);
        if (value) {
            total += *value;
            contributed = true;
        }
    }

    if (!contributed) {
        return std::nullopt;
    }
    return total;
}

std::optional<FieldLabel> resolve_label(const StatementTable& table,
                                        const FieldCandidateList& candidates) {
    if (table.empty()) {
        return std::nullopt;
    }
    for (const auto& candidate : candidates) {
        for (size_t col = 0; col < table.column_count(); ++col) {
            if (labels_match(candidate, table.column(col)) &&
                coerce_numeric(table.cell(0, col))) {
                return table.column(col);
            }
        }
    }
    return std::nullopt;
}

} // namespace fairvalue
