#include "valuation.hpp"
#include "logger.hpp"
#include "normalizer.hpp"
#include <chrono>
#include <cmath>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace fairvalue {

// ============================================================================
// Result types
// ============================================================================

ValuationConfig::ValuationConfig()
    : recommendation_threshold_pct(10.0) {}

MarketComparison::MarketComparison()
    : current_price(0.0),
      upside_downside_pct(0.0),
      recommendation(Recommendation::Hold) {}

DataQuality::DataQuality()
    : has_real_price(false),
      has_financials(false),
      pe_reliable(false),
      pb_reliable(false) {}

ValuationReport::ValuationReport()
    : symbol(),
      metrics(),
      result(),
      market_comparison(std::nullopt),
      data_quality(),
      assumptions_used(),
      execution_time_ms(0.0) {}

std::string recommendation_to_string(Recommendation recommendation) {
    switch (recommendation) {
        case Recommendation::Buy: return "BUY";
        case Recommendation::Hold: return "HOLD";
        case Recommendation::Sell: return "SELL";
    }
    return "UNKNOWN";
}

Recommendation recommend(double upside_downside_pct, double threshold_pct) {
    if (upside_downside_pct > threshold_pct) {
        return Recommendation::Buy;
    }
    if (upside_downside_pct > -threshold_pct) {
        return Recommendation::Hold;
    }
    return Recommendation::Sell;
}

// ============================================================================
// Pipeline helpers
// ============================================================================

namespace {

bool is_positive(const NormalizedMetrics& metrics, const char* name) {
    auto value = metrics.get(name);
    return value && *value > 0.0;
}

void require_valuable(const NormalizedMetrics& metrics, const std::string& symbol) {
    if (!is_positive(metrics, metric::SHARES_OUTSTANDING)) {
        throw DataUnavailableError("No positive share count available for " + symbol);
    }
    if (!metrics.has(metric::NET_INCOME) && !metrics.has(metric::REVENUE) &&
        !metrics.has(metric::EBIT) && !metrics.has(metric::EPS)) {
        throw DataUnavailableError("No earnings or revenue data available for " + symbol);
    }
}

void log_model_outcomes(const std::vector<ModelOutcome>& outcomes, const std::string& symbol) {
    Logger& logger = Logger::get_instance();
    for (const auto& outcome : outcomes) {
        ValuationContext ctx(symbol, "model");
        ctx.model = model_name(outcome.model);
        if (outcome.status == ModelStatus::Fallback) {
            logger.log_model_fallback(ctx, outcome.detail, outcome.value_per_share);
        } else if (outcome.status == ModelStatus::Failed) {
            logger.log_model_failed(ctx, outcome.detail);
        }
    }
}

std::optional<MarketComparison> compare_with_market(const NormalizedMetrics& metrics,
                                                    const ValuationResult& result,
                                                    const ValuationConfig& config) {
    auto price = metrics.get(metric::CURRENT_PRICE);
    if (!price || *price <= 0.0 || !(result.weighted_average > 0.0)) {
        return std::nullopt;
    }

    MarketComparison comparison;
    comparison.current_price = *price;
    comparison.upside_downside_pct = (result.weighted_average - *price) / *price * 100.0;
    comparison.recommendation = recommend(comparison.upside_downside_pct,
                                          config.recommendation_threshold_pct);
    return comparison;
}

DataQuality assess_data_quality(const NormalizedMetrics& metrics) {
    DataQuality quality;
    quality.has_real_price = is_positive(metrics, metric::CURRENT_PRICE);
    quality.has_financials = metrics.has(metric::NET_INCOME);
    quality.pe_reliable = is_positive(metrics, metric::PE_RATIO);
    quality.pb_reliable = is_positive(metrics, metric::PB_RATIO);
    return quality;
}

const FieldCatalog& builtin_catalog() {
    static const FieldCatalog catalog = FieldCatalog::default_catalog();
    return catalog;
}

} // anonymous namespace

// ============================================================================
// Valuation Implementation
// ============================================================================

ValuationReport run_valuation(
    const ValuationRequest& request,
    const FieldCatalog& catalog,
    const ValuationConfig& config)
{
    auto start_time = std::chrono::high_resolution_clock::now();
    const std::string& symbol = request.symbol();
    Logger& logger = Logger::get_instance();

    request.assumptions.validate();

    logger.log_valuation_start(ValuationContext(symbol, "extract"),
                               frequency_to_string(request.statements.frequency),
                               request.statements.income_statement.period_count());

    ValuationReport report;
    report.symbol = symbol;
    report.assumptions_used = request.assumptions;

    NormalizedMetrics primitives = extract_primitives(request.statements, request.market, catalog);
    report.metrics = normalize(primitives, symbol);

    try {
        require_valuable(report.metrics, symbol);
    } catch (const DataUnavailableError& e) {
        logger.log_error(ValuationContext(symbol, "normalize"), e.what());
        throw;
    }

    std::vector<ModelOutcome> outcomes = calculate_all_models(report.metrics, request.assumptions);
    log_model_outcomes(outcomes, symbol);

    report.result = aggregate(outcomes, request.assumptions.weights);
    report.market_comparison = compare_with_market(report.metrics, report.result, config);
    report.data_quality = assess_data_quality(report.metrics);

    auto end_time = std::chrono::high_resolution_clock::now();
    report.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    size_t models_used = report.result.summary ? report.result.summary->models_used : 0;
    logger.log_valuation_complete(ValuationContext(symbol, "aggregate"),
                                  report.result.weighted_average, models_used,
                                  report.execution_time_ms);

    return report;
}

ValuationReport run_valuation(const ValuationRequest& request, const ValuationConfig& config) {
    return run_valuation(request, builtin_catalog(), config);
}

std::vector<BatchEntry> run_batch_valuation(
    const std::vector<ValuationRequest>& requests,
    const FieldCatalog& catalog,
    const ValuationConfig& config)
{
    std::vector<BatchEntry> entries(requests.size());

    // Each iteration writes only its own entry
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (size_t i = 0; i < requests.size(); ++i) {
        BatchEntry& entry = entries[i];
        entry.symbol = requests[i].symbol();
        try {
            entry.report = run_valuation(requests[i], catalog, config);
        } catch (const std::exception& e) {
            entry.error = e.what();
            Logger::get_instance().log_warning(ValuationContext(entry.symbol, "batch"),
                                               "Symbol skipped: " + entry.error);
        }
    }

    return entries;
}

} // namespace fairvalue
