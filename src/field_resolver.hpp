#ifndef FAIRVALUE_FIELD_RESOLVER_HPP
#define FAIRVALUE_FIELD_RESOLVER_HPP

#include "statement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fairvalue {

// Ordered label patterns for one logical quantity; earlier entries win.
using FieldCandidateList = std::vector<std::string>;

enum class AggregationMode : uint8_t {
    Latest = 0,       // Most recent period only
    TrailingSum = 1   // Sum of the four most recent periods (TTM)
};

// Number of periods summed by AggregationMode::TrailingSum
constexpr size_t TRAILING_PERIODS = 4;

// Shortest folded, trimmed label allowed to match by containment
constexpr size_t MIN_CONTAINMENT_LENGTH = 6;

// Case-insensitive label match: exact equality, or either string contains
// the other when the contained one has at least MIN_CONTAINMENT_LENGTH
// bytes. Shorter labels such as "EBIT" or "Year" match only exactly. A plain
// candidate is compared against the column name; a
// candidate written "category::name" must match both parts.
// Empty strings never match.
bool labels_match(const std::string& candidate, const FieldLabel& label);

// Numeric view of a cell. Numbers pass through, text is trimmed and stripped
// of thousands separators before a full parse. Missing, unparsable and
// non-finite values yield nullopt.
std::optional<double> coerce_numeric(const CellValue& value);

// Resolve a logical quantity from a statement table.
//
// Latest:      for each candidate in priority order, scan matching columns in
//              schema order and return the first numeric value of the most
//              recent row.
// TrailingSum: requires at least TRAILING_PERIODS rows, otherwise nullopt.
//              Each of the most recent TRAILING_PERIODS rows contributes the
//              value of its own first matching candidate, so label drift
//              between periods is tolerated. nullopt if no row contributes.
//
// nullopt means "unavailable", which callers must keep distinct from zero.
std::optional<double> resolve(const StatementTable& table,
                              const FieldCandidateList& candidates,
                              AggregationMode mode = AggregationMode::Latest);

// Label of the column that resolve(..., Latest) would read, for diagnostics
std::optional<FieldLabel> resolve_label(const StatementTable& table,
                                        const FieldCandidateList& candidates);

} // namespace fairvalue

#endif // FAIRVALUE_FIELD_RESOLVER_HPP
