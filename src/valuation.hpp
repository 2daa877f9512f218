#ifndef FAIRVALUE_VALUATION_HPP
#define FAIRVALUE_VALUATION_HPP

#include "aggregator.hpp"
#include "assumptions.hpp"
#include "field_catalog.hpp"
#include "metrics.hpp"
#include "statement.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fairvalue {

// Thrown when a symbol cannot be valued at all: no positive share count, or
// none of net income, revenue, EBIT and EPS could be resolved
class DataUnavailableError : public std::runtime_error {
public:
    explicit DataUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

// Everything needed to value one symbol
struct ValuationRequest {
    MarketData market;
    StatementSet statements;
    ValuationAssumptions assumptions;

    const std::string& symbol() const { return market.symbol; }
};

// Configuration options for valuation
struct ValuationConfig {
    double recommendation_threshold_pct;   // BUY above +t%, SELL at or below -t%

    ValuationConfig();
};

enum class Recommendation : uint8_t {
    Buy = 0,
    Hold = 1,
    Sell = 2
};

std::string recommendation_to_string(Recommendation recommendation);

// BUY if upside > threshold, HOLD if upside > -threshold, SELL otherwise
Recommendation recommend(double upside_downside_pct, double threshold_pct);

struct MarketComparison {
    double current_price;
    double upside_downside_pct;   // (fair value - price) / price * 100
    Recommendation recommendation;

    MarketComparison();
};

struct DataQuality {
    bool has_real_price;   // Positive current price available
    bool has_financials;   // Net income resolved
    bool pe_reliable;      // Positive P/E available
    bool pb_reliable;      // Positive P/B available

    DataQuality();
};

// Full output for one symbol
struct ValuationReport {
    std::string symbol;
    NormalizedMetrics metrics;
    ValuationResult result;
    std::optional<MarketComparison> market_comparison;
    DataQuality data_quality;
    ValuationAssumptions assumptions_used;
    double execution_time_ms;

    ValuationReport();
};

// Outcome of one symbol in a batch: a report, or the error that stopped it
struct BatchEntry {
    std::string symbol;
    std::optional<ValuationReport> report;
    std::string error;

    bool ok() const { return report.has_value(); }
};

// Value one symbol: extract primitives through the catalog, normalize,
// evaluate the four models, aggregate and compare with the market price.
//
// Throws std::invalid_argument if the request's assumptions are invalid and
// DataUnavailableError if the statements cannot support any valuation.
// Individual model problems never throw; they show up as Fallback/Failed
// outcomes.
ValuationReport run_valuation(
    const ValuationRequest& request,
    const FieldCatalog& catalog,
    const ValuationConfig& config = ValuationConfig()
);

// Overload using the built-in field catalog
ValuationReport run_valuation(
    const ValuationRequest& request,
    const ValuationConfig& config = ValuationConfig()
);

// Value many symbols. Requests are independent and run in parallel when built
// with OpenMP. Entries are returned in request order; a failing symbol yields
// an entry with its error message and does not affect the others.
std::vector<BatchEntry> run_batch_valuation(
    const std::vector<ValuationRequest>& requests,
    const FieldCatalog& catalog,
    const ValuationConfig& config = ValuationConfig()
);

} // namespace fairvalue

#endif // FAIRVALUE_VALUATION_HPP
