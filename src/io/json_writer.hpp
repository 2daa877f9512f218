#ifndef FAIRVALUE_IO_JSON_WRITER_HPP
#define FAIRVALUE_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../valuation.hpp"

namespace fairvalue {
namespace io {

// Canonical metrics always present in the "metrics" object (null when unavailable)
const std::vector<std::string>& reported_metrics();

// JSON document for one report: symbol, valuations, model_status, summary,
// market_comparison, data_quality, metrics, assumptions_used, execution_time_ms
nlohmann::ordered_json valuation_report_to_json(const ValuationReport& report);

// Write ValuationReport to JSON format
void write_valuation_report_json(std::ostream& os, const ValuationReport& report,
                                 bool pretty_print = true);

// Write ValuationReport to JSON file
void write_valuation_report_json(const std::string& filepath, const ValuationReport& report,
                                 bool pretty_print = true);

// Write a batch: {"results": [...], "errors": [{"symbol", "error"}], counts}
void write_batch_json(std::ostream& os, const std::vector<BatchEntry>& entries,
                      bool pretty_print = true);

void write_batch_json(const std::string& filepath, const std::vector<BatchEntry>& entries,
                      bool pretty_print = true);

} // namespace io
} // namespace fairvalue

#endif // FAIRVALUE_IO_JSON_WRITER_HPP
