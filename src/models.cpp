#include "models.hpp"
#include "fallback.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fairvalue {

// ============================================================================
// Names and outcomes
// ============================================================================

std::string model_name(ValuationModel model) {
    switch (model) {
        case ValuationModel::Fcfe: return "fcfe";
        case ValuationModel::Fcff: return "fcff";
        case ValuationModel::JustifiedPe: return "justified_pe";
        case ValuationModel::JustifiedPb: return "justified_pb";
    }
    return "unknown";
}

ValuationModel model_from_name(const std::string& name) {
    for (ValuationModel model : ALL_MODELS) {
        if (model_name(model) == name) {
            return model;
        }
    }
    throw std::invalid_argument("Unknown valuation model: " + name);
}

std::string model_status_to_string(ModelStatus status) {
    switch (status) {
        case ModelStatus::Computed: return "computed";
        case ModelStatus::Fallback: return "fallback";
        case ModelStatus::Failed: return "failed";
    }
    return "unknown";
}

ModelOutcome::ModelOutcome()
    : model(ValuationModel::Fcfe), value_per_share(0.0), status(ModelStatus::Failed), detail() {}

ModelOutcome::ModelOutcome(ValuationModel m, double value, ModelStatus s, std::string text)
    : model(m), value_per_share(value), status(s), detail(std::move(text)) {}

ModelOutcome ModelOutcome::failed(ValuationModel m, std::string reason) {
    return ModelOutcome(m, 0.0, ModelStatus::Failed, std::move(reason));
}

bool ModelOutcome::has_positive_value() const {
    return std::isfinite(value_per_share) && value_per_share > 0.0;
}

// ============================================================================
// Building blocks
// ============================================================================

namespace {

std::string describe(const char* label, double value) {
    std::ostringstream oss;
    oss << label << "=" << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

std::optional<double> share_count(const NormalizedMetrics& metrics) {
    return positive(metrics.get(metric::SHARES_OUTSTANDING));
}

// The assumption's target ROE when set, the company's observed ROE otherwise
std::optional<double> roe_for(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions) {
    if (assumptions.target_roe) {
        return assumptions.target_roe;
    }
    return metrics.get(metric::ROE);
}

// Shared DCF tail of FCFE and FCFF
ModelOutcome discount_to_per_share(ValuationModel model,
                                   double base_cash_flow,
                                   double discount_rate,
                                   const char* rate_name,
                                   const NormalizedMetrics& metrics,
                                   const ValuationAssumptions& assumptions) {
    auto shares = share_count(metrics);
    if (!shares) {
        return ModelOutcome::failed(model, "shares outstanding unavailable");
    }
    if (assumptions.forecast_years < 1) {
        return ModelOutcome::failed(model, "forecast horizon must be at least one year");
    }

    auto total = present_value_of_growing_cash_flows(base_cash_flow,
                                                     assumptions.short_term_growth,
                                                     assumptions.terminal_growth,
                                                     discount_rate,
                                                     assumptions.forecast_years);
    if (!total) {
        return ModelOutcome::failed(model, std::string(rate_name) + " must exceed terminal growth");
    }

    return ModelOutcome(model, *total / *shares, ModelStatus::Computed,
                        describe("base_cash_flow", base_cash_flow));
}

} // anonymous namespace

std::optional<double> present_value_of_growing_cash_flows(double base_cash_flow,
                                                          double growth,
                                                          double terminal_growth,
                                                          double discount_rate,
                                                          int years) {
    if (years < 1) {
        throw std::invalid_argument("Forecast horizon must be at least one year");
    }
    if (discount_rate <= terminal_growth || discount_rate <= -1.0) {
        return std::nullopt;
    }

    double total = 0.0;
    double cash_flow = base_cash_flow;
    double discount = 1.0;
    for (int t = 1; t <= years; ++t) {
        cash_flow *= (1.0 + growth);
        discount *= (1.0 + discount_rate);
        total += cash_flow / discount;
    }

    // cash_flow is CF_N and discount is (1+r)^N here
    double terminal_value = cash_flow * (1.0 + terminal_growth) / (discount_rate - terminal_growth);
    total += terminal_value / discount;

    return total;
}

double sustainable_growth(double roe, double payout_ratio) {
    return roe * (1.0 - payout_ratio);
}

std::optional<double> justified_pe_multiple(double roe, double payout_ratio, double required_return) {
    double g = sustainable_growth(roe, payout_ratio);
    if (required_return <= g) {
        return std::nullopt;
    }
    return payout_ratio * (1.0 + g) / (required_return - g);
}

std::optional<double> justified_pb_multiple(double roe, double payout_ratio, double required_return) {
    double g = sustainable_growth(roe, payout_ratio);
    if (required_return <= g || roe <= g) {
        return std::nullopt;
    }
    return (roe - g) / (required_return - g);
}

std::optional<double> free_cash_flow_to_equity(const NormalizedMetrics& metrics) {
    auto net_income = metrics.get(metric::NET_INCOME);
    if (!net_income) {
        return std::nullopt;
    }
    return *net_income
         + metrics.value_or(metric::NON_CASH_CHARGES, 0.0)
         + metrics.value_or(metric::NET_BORROWING, 0.0)
         - metrics.value_or(metric::WORKING_CAPITAL_CHANGE, 0.0)
         + metrics.value_or(metric::FIXED_CAPITAL_INVESTMENT, 0.0);
}

std::optional<double> free_cash_flow_to_firm(const NormalizedMetrics& metrics, double tax_rate) {
    auto net_income = metrics.get(metric::NET_INCOME);
    if (!net_income) {
        return std::nullopt;
    }
    double after_tax_interest = std::fabs(metrics.value_or(metric::INTEREST_EXPENSE, 0.0)) * (1.0 - tax_rate);
    return *net_income
         + metrics.value_or(metric::NON_CASH_CHARGES, 0.0)
         + after_tax_interest
         - metrics.value_or(metric::WORKING_CAPITAL_CHANGE, 0.0)
         + metrics.value_or(metric::FIXED_CAPITAL_INVESTMENT, 0.0);
}

// ============================================================================
// Models
// ============================================================================

ModelOutcome calculate_fcfe(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions) {
    auto fcfe = free_cash_flow_to_equity(metrics);
    if (!fcfe) {
        return ModelOutcome::failed(ValuationModel::Fcfe, "net income unavailable");
    }
    return discount_to_per_share(ValuationModel::Fcfe, *fcfe, assumptions.cost_of_equity,
                                 "cost of equity", metrics, assumptions);
}

ModelOutcome calculate_fcff(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions) {
    auto fcff = free_cash_flow_to_firm(metrics, assumptions.tax_rate);
    if (!fcff) {
        return ModelOutcome::failed(ValuationModel::Fcff, "net income unavailable");
    }
    return discount_to_per_share(ValuationModel::Fcff, *fcff, assumptions.wacc,
                                 "WACC", metrics, assumptions);
}

ModelOutcome calculate_justified_pe(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions) {
    auto eps = metrics.get(metric::EPS);
    if (!eps) {
        return ModelOutcome::failed(ValuationModel::JustifiedPe, "EPS unavailable");
    }

    auto roe = roe_for(metrics, assumptions);
    if (!roe) {
        return ModelOutcome::failed(ValuationModel::JustifiedPe, "ROE unavailable");
    }

    auto multiple = justified_pe_multiple(*roe, assumptions.payout_ratio, assumptions.cost_of_equity);
    if (!multiple) {
        return ModelOutcome(ValuationModel::JustifiedPe, JUSTIFIED_PE_FALLBACK * *eps,
                            ModelStatus::Fallback,
                            "cost of equity <= sustainable growth; " +
                            describe("multiple", JUSTIFIED_PE_FALLBACK));
    }

    return ModelOutcome(ValuationModel::JustifiedPe, *multiple * *eps, ModelStatus::Computed,
                        describe("multiple", *multiple));
}

ModelOutcome calculate_justified_pb(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions) {
    auto bvps = first_available({
        [&] { return metrics.get(metric::BOOK_VALUE_PER_SHARE); },
        [&] { return safe_divide(metrics.get(metric::TOTAL_EQUITY), share_count(metrics)); },
        [&] { return safe_divide(subtract(metrics.get(metric::TOTAL_ASSETS),
                                          metrics.get(metric::TOTAL_LIABILITIES)),
                                 share_count(metrics)); }
    });
    if (!bvps) {
        return ModelOutcome::failed(ValuationModel::JustifiedPb, "book value per share unavailable");
    }

    auto roe = roe_for(metrics, assumptions);
    if (!roe) {
        return ModelOutcome::failed(ValuationModel::JustifiedPb, "ROE unavailable");
    }

    auto multiple = justified_pb_multiple(*roe, assumptions.payout_ratio, assumptions.cost_of_equity);
    if (!multiple) {
        return ModelOutcome(ValuationModel::JustifiedPb, JUSTIFIED_PB_FALLBACK * *bvps,
                            ModelStatus::Fallback,
                            "growth not below cost of equity and ROE; " +
                            describe("multiple", JUSTIFIED_PB_FALLBACK));
    }

    return ModelOutcome(ValuationModel::JustifiedPb, *multiple * *bvps, ModelStatus::Computed,
                        describe("multiple", *multiple));
}

ModelOutcome calculate_model(ValuationModel model,
                             const NormalizedMetrics& metrics,
                             const ValuationAssumptions& assumptions) {
    switch (model) {
        case ValuationModel::Fcfe: return calculate_fcfe(metrics, assumptions);
        case ValuationModel::Fcff: return calculate_fcff(metrics, assumptions);
        case ValuationModel::JustifiedPe: return calculate_justified_pe(metrics, assumptions);
        case ValuationModel::JustifiedPb: return calculate_justified_pb(metrics, assumptions);
    }
    throw std::invalid_argument("Unknown valuation model");
}

std::vector<ModelOutcome> calculate_all_models(const NormalizedMetrics& metrics,
                                               const ValuationAssumptions& assumptions) {
    std::vector<ModelOutcome> outcomes;
    outcomes.reserve(ALL_MODELS.size());
    for (ValuationModel model : ALL_MODELS) {
        outcomes.push_back(calculate_model(model, metrics, assumptions));
    }
    return outcomes;
}

} // namespace fairvalue
