#ifndef FAIRVALUE_ASSUMPTIONS_HPP
#define FAIRVALUE_ASSUMPTIONS_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace fairvalue {

enum class ValuationModel : uint8_t;

// Relative weight of each valuation model. Weights need not sum to 1; the
// aggregator renormalizes over the models that produce a usable value.
struct ModelWeights {
    double fcfe;
    double fcff;
    double justified_pe;
    double justified_pb;

    ModelWeights();
    ModelWeights(double fcfe_weight, double fcff_weight, double pe_weight, double pb_weight);

    double weight_for(ValuationModel model) const;
    double total() const { return fcfe + fcff + justified_pe + justified_pb; }
};

// ValuationAssumptions: market and company parameters shared by the four models.
// Rates are fractions (0.12 = 12%).
struct ValuationAssumptions {
    double short_term_growth;          // Growth over the forecast horizon
    double terminal_growth;            // Perpetual growth after the horizon
    double cost_of_equity;             // Discount rate for FCFE and justified multiples
    double wacc;                       // Discount rate for FCFF
    double tax_rate;                   // Applied to interest in FCFF
    int forecast_years;                // Explicit forecast horizon
    std::optional<double> target_roe;  // Overrides the company's observed ROE when set
    double payout_ratio;               // Dividend payout for the justified multiples
    ModelWeights weights;

    ValuationAssumptions();

    // Throws std::invalid_argument when a parameter is outside its domain:
    // negative weight, forecast_years outside 1..50, tax_rate outside [0, 1),
    // payout_ratio outside [0, 1], or a non-finite rate.
    // terminal_growth >= discount rate is not rejected here; the affected
    // models report it as a failure.
    void validate() const;

    // JSON keys follow the field names; model weights live under "model_weights".
    // Missing keys keep their defaults. Throws std::invalid_argument on bad values.
    static ValuationAssumptions from_json(const nlohmann::json& j);
    nlohmann::ordered_json to_json() const;

    static ValuationAssumptions load_from_json(const std::string& filepath);

    // Dispatch on extension: .json or .csv
    static ValuationAssumptions load(const std::string& filepath);

    // Load from CSV: expects columns name,value (header row skipped), e.g.
    //   cost_of_equity,0.12
    //   weight_fcfe,0.4
    static ValuationAssumptions load_from_csv(const std::string& filepath);
    static ValuationAssumptions load_from_csv(std::istream& is);

    // Apply one named parameter; returns false if the name is unknown
    bool set_parameter(const std::string& name, double value);
};

constexpr int MAX_FORECAST_YEARS = 50;

} // namespace fairvalue

#endif // FAIRVALUE_ASSUMPTIONS_HPP
