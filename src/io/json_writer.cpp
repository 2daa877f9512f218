#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using ordered_json = nlohmann::ordered_json;

namespace fairvalue {
namespace io {

const std::vector<std::string>& reported_metrics() {
    static const std::vector<std::string> names = {
        metric::CURRENT_PRICE, metric::SHARES_OUTSTANDING, metric::MARKET_CAP,
        metric::REVENUE, metric::NET_INCOME, metric::GROSS_PROFIT, metric::EBIT,
        metric::EBITDA, metric::INTEREST_EXPENSE, metric::DEPRECIATION,
        metric::TOTAL_ASSETS, metric::TOTAL_LIABILITIES, metric::TOTAL_EQUITY,
        metric::TOTAL_DEBT, metric::CASH,
        metric::NON_CASH_CHARGES, metric::NET_BORROWING,
        metric::FIXED_CAPITAL_INVESTMENT, metric::WORKING_CAPITAL_CHANGE,
        metric::EPS, metric::BOOK_VALUE_PER_SHARE, metric::DIVIDEND_PER_SHARE,
        metric::PE_RATIO, metric::PB_RATIO, metric::PS_RATIO,
        metric::ENTERPRISE_VALUE, metric::EV_TO_EBITDA,
        metric::GROSS_MARGIN, metric::EBIT_MARGIN, metric::NET_PROFIT_MARGIN,
        metric::ROA, metric::ROE,
        metric::ASSET_TURNOVER, metric::INVENTORY_TURNOVER,
        metric::FIXED_ASSET_TURNOVER, metric::RECEIVABLES_TURNOVER,
        metric::CURRENT_RATIO, metric::QUICK_RATIO, metric::CASH_RATIO,
        metric::DEBT_TO_EQUITY, metric::EQUITY_MULTIPLIER, metric::FINANCIAL_LEVERAGE,
        metric::INTEREST_COVERAGE
    };
    return names;
}

namespace {

ordered_json optional_number(const std::optional<double>& value) {
    return value ? ordered_json(*value) : ordered_json(nullptr);
}

ordered_json metrics_to_json(const NormalizedMetrics& metrics) {
    ordered_json j = ordered_json::object();
    for (const auto& name : reported_metrics()) {
        j[name] = optional_number(metrics.get(name));
    }
    // Anything else the statements supplied, after the fixed set
    for (const auto& [name, entry] : metrics.entries()) {
        if (!j.contains(name)) {
            j[name] = entry.value;
        }
    }
    return j;
}

} // anonymous namespace

ordered_json valuation_report_to_json(const ValuationReport& report) {
    ordered_json j;
    j["symbol"] = report.symbol;

    ordered_json valuations = ordered_json::object();
    ordered_json status = ordered_json::object();
    for (const auto& outcome : report.result.outcomes) {
        std::string name = model_name(outcome.model);
        valuations[name] = outcome.value_per_share;
        status[name] = {
            {"status", model_status_to_string(outcome.status)},
            {"detail", outcome.detail}
        };
    }
    valuations["weighted_average"] = report.result.weighted_average;
    j["valuations"] = valuations;
    j["model_status"] = status;

    ordered_json summary = ordered_json::object();
    if (report.result.summary) {
        const ValuationSummary& s = *report.result.summary;
        summary["mean"] = s.mean;
        summary["min"] = s.min;
        summary["max"] = s.max;
        summary["models_used"] = s.models_used;
        summary["total_models"] = s.total_models;
    }
    j["summary"] = summary;

    if (report.market_comparison) {
        const MarketComparison& mc = *report.market_comparison;
        j["market_comparison"] = {
            {"current_price", mc.current_price},
            {"upside_downside_pct", mc.upside_downside_pct},
            {"recommendation", recommendation_to_string(mc.recommendation)}
        };
    } else {
        j["market_comparison"] = nullptr;
    }

    j["data_quality"] = {
        {"has_real_price", report.data_quality.has_real_price},
        {"has_financials", report.data_quality.has_financials},
        {"pe_reliable", report.data_quality.pe_reliable},
        {"pb_reliable", report.data_quality.pb_reliable}
    };

    j["metrics"] = metrics_to_json(report.metrics);
    j["assumptions_used"] = report.assumptions_used.to_json();
    j["execution_time_ms"] = report.execution_time_ms;
    return j;
}

void write_valuation_report_json(std::ostream& os, const ValuationReport& report,
                                 bool pretty_print) {
    os << valuation_report_to_json(report).dump(pretty_print ? 2 : -1) << "\n";
}

void write_valuation_report_json(const std::string& filepath, const ValuationReport& report,
                                 bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_valuation_report_json(file, report, pretty_print);
}

void write_batch_json(std::ostream& os, const std::vector<BatchEntry>& entries,
                      bool pretty_print) {
    ordered_json results = ordered_json::array();
    ordered_json errors = ordered_json::array();
    for (const auto& entry : entries) {
        if (entry.ok()) {
            results.push_back(valuation_report_to_json(*entry.report));
        } else {
            errors.push_back({{"symbol", entry.symbol}, {"error", entry.error}});
        }
    }

    ordered_json j;
    j["symbols_valued"] = results.size();
    j["symbols_failed"] = errors.size();
    j["results"] = results;
    j["errors"] = errors;
    os << j.dump(pretty_print ? 2 : -1) << "\n";
}

void write_batch_json(const std::string& filepath, const std::vector<BatchEntry>& entries,
                      bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_batch_json(file, entries, pretty_print);
}

} // namespace io
} // namespace fairvalue
