#ifndef FAIRVALUE_FIELD_CATALOG_HPP
#define FAIRVALUE_FIELD_CATALOG_HPP

#include "field_resolver.hpp"
#include "metrics.hpp"
#include "statement.hpp"
#include <string>
#include <vector>

namespace fairvalue {

// Flow metrics are measured over a period and summed over four quarters on
// quarterly data. Stock metrics are balances at a point in time.
enum class MetricKind : uint8_t {
    Flow = 0,
    Stock = 1
};

std::string metric_kind_to_string(MetricKind kind);
MetricKind metric_kind_from_string(const std::string& text);

// Where and how to find one canonical metric
struct FieldSpec {
    std::string metric;              // Canonical name (see namespace metric)
    StatementKind statement;         // Statement that carries the line item
    MetricKind kind;
    FieldCandidateList candidates;   // Priority-ordered vendor labels
    bool percent_scaled;             // Ratio reported as a percentage (e.g. "ROE (%)")

    FieldSpec();
    FieldSpec(std::string metric_name, StatementKind source, MetricKind metric_kind,
              FieldCandidateList labels, bool percent = false);
};

// FieldCatalog: the priority-ordered candidate table keyed by canonical metric.
// A metric may have several specs (e.g. EBITDA from the income statement,
// then from the ratio table); earlier specs win.
class FieldCatalog {
public:
    FieldCatalog() = default;

    // Built-in catalog: English, Vietnamese and camelCase vendor labels
    static FieldCatalog default_catalog();

    // Overlay a JSON catalog file on `base`. Every metric named in the file
    // replaces all of base's specs for that metric; other metrics are kept.
    // Format: {"metrics": {"<name>": {"statement", "kind", "candidates",
    // "percent_scaled"} | [ ...specs ]}}
    // Throws ConfigParseError on malformed content.
    static FieldCatalog load_from_json(const std::string& filepath);
    static FieldCatalog load_from_json(const std::string& filepath, const FieldCatalog& base);
    static FieldCatalog parse_json(const std::string& json_string, const FieldCatalog& base);

    // Append a spec. Throws std::invalid_argument if the metric name or the
    // candidate list is empty.
    void add(FieldSpec spec);

    // Drop every spec for `metric`; returns the number removed
    size_t remove(const std::string& metric);

    // First spec for `metric`, or nullptr
    const FieldSpec* find(const std::string& metric) const;
    std::vector<const FieldSpec*> find_all(const std::string& metric) const;

    const std::vector<FieldSpec>& specs() const { return specs_; }
    size_t size() const { return specs_.size(); }

private:
    std::vector<FieldSpec> specs_;
};

// Aggregation used for a spec at a reporting frequency: TrailingSum for flow
// metrics on quarterly data, Latest otherwise
AggregationMode aggregation_for(const FieldSpec& spec, ReportingFrequency frequency);

// Convert a percentage-scaled ratio to a raw fraction. Values with magnitude
// below 1 are taken to be fractions already.
double percent_to_fraction(double value);

// Run the catalog against a statement set. Market data supplies
// current_price and shares_outstanding ahead of any statement label.
// Unresolved metrics are left absent.
NormalizedMetrics extract_primitives(const StatementSet& statements,
                                     const MarketData& market,
                                     const FieldCatalog& catalog);

} // namespace fairvalue

#endif // FAIRVALUE_FIELD_CATALOG_HPP
