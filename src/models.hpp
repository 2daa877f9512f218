#ifndef FAIRVALUE_MODELS_HPP
#define FAIRVALUE_MODELS_HPP

#include "assumptions.hpp"
#include "metrics.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fairvalue {

enum class ValuationModel : uint8_t {
    Fcfe = 0,
    Fcff = 1,
    JustifiedPe = 2,
    JustifiedPb = 3
};

constexpr std::array<ValuationModel, 4> ALL_MODELS = {
    ValuationModel::Fcfe,
    ValuationModel::Fcff,
    ValuationModel::JustifiedPe,
    ValuationModel::JustifiedPb
};

// "fcfe", "fcff", "justified_pe", "justified_pb"
std::string model_name(ValuationModel model);
ValuationModel model_from_name(const std::string& name);

enum class ModelStatus : uint8_t {
    Computed = 0,   // Model formula applied
    Fallback = 1,   // Ill-conditioned parameters, fixed multiple applied
    Failed = 2      // No value; value_per_share holds the 0 sentinel
};

std::string model_status_to_string(ModelStatus status);

// Result of one valuation model for one symbol
struct ModelOutcome {
    ValuationModel model;
    double value_per_share;
    ModelStatus status;
    std::string detail;

    ModelOutcome();
    ModelOutcome(ValuationModel m, double value, ModelStatus s, std::string text = "");

    static ModelOutcome failed(ValuationModel m, std::string reason);

    // Finite and strictly positive, whatever the status
    bool has_positive_value() const;
};

// Multiples applied when the growth implied by ROE and payout is not below
// the required return
constexpr double JUSTIFIED_PE_FALLBACK = 15.0;
constexpr double JUSTIFIED_PB_FALLBACK = 1.0;

// Present value at t=0 of base*(1+g)^t for t = 1..years, plus a Gordon
// terminal value CF_N*(1+g_T)/(r-g_T) discounted from period N.
// Returns nullopt when discount_rate <= terminal_growth or discount_rate <= -1.
// Throws std::invalid_argument if years < 1.
std::optional<double> present_value_of_growing_cash_flows(double base_cash_flow,
                                                          double growth,
                                                          double terminal_growth,
                                                          double discount_rate,
                                                          int years);

// Sustainable growth g = roe * (1 - payout_ratio)
double sustainable_growth(double roe, double payout_ratio);

// payout*(1+g)/(r-g); nullopt when r <= g
std::optional<double> justified_pe_multiple(double roe, double payout_ratio, double required_return);

// (roe-g)/(r-g); nullopt when r <= g or roe <= g
std::optional<double> justified_pb_multiple(double roe, double payout_ratio, double required_return);

// Current-period free cash flows from normalized metrics (statement signs).
// Components other than net income count as zero when absent.
std::optional<double> free_cash_flow_to_equity(const NormalizedMetrics& metrics);
std::optional<double> free_cash_flow_to_firm(const NormalizedMetrics& metrics, double tax_rate);

// The four models. None throws on missing inputs: they report Failed with a
// reason instead.
ModelOutcome calculate_fcfe(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions);
ModelOutcome calculate_fcff(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions);
ModelOutcome calculate_justified_pe(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions);
ModelOutcome calculate_justified_pb(const NormalizedMetrics& metrics, const ValuationAssumptions& assumptions);

ModelOutcome calculate_model(ValuationModel model,
                             const NormalizedMetrics& metrics,
                             const ValuationAssumptions& assumptions);

// One outcome per model, in ALL_MODELS order
std::vector<ModelOutcome> calculate_all_models(const NormalizedMetrics& metrics,
                                               const ValuationAssumptions& assumptions);

} // namespace fairvalue

#endif // FAIRVALUE_MODELS_HPP
