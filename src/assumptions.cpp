#include "assumptions.hpp"
#include "models.hpp"
#include "config_parser.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace fairvalue {

// ============================================================================
// ModelWeights Implementation
// ============================================================================

ModelWeights::ModelWeights()
    : fcfe(0.25), fcff(0.25), justified_pe(0.25), justified_pb(0.25) {}

ModelWeights::ModelWeights(double fcfe_weight, double fcff_weight, double pe_weight, double pb_weight)
    : fcfe(fcfe_weight), fcff(fcff_weight), justified_pe(pe_weight), justified_pb(pb_weight) {}

double ModelWeights::weight_for(ValuationModel model) const {
    switch (model) {
        case ValuationModel::Fcfe: return fcfe;
        case ValuationModel::Fcff: return fcff;
        case ValuationModel::JustifiedPe: return justified_pe;
        case ValuationModel::JustifiedPb: return justified_pb;
    }
    throw std::invalid_argument("Unknown valuation model");
}

// ============================================================================
// ValuationAssumptions Implementation
// ============================================================================

ValuationAssumptions::ValuationAssumptions()
    : short_term_growth(0.05),
      terminal_growth(0.02),
      cost_of_equity(0.12),
      wacc(0.10),
      tax_rate(0.20),
      forecast_years(5),
      target_roe(std::nullopt),
      payout_ratio(0.40),
      weights() {}

namespace {

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string(name) + " must be a finite number");
    }
}

void require_weight(double value, const char* name) {
    require_finite(value, name);
    if (value < 0.0) {
        throw std::invalid_argument(std::string(name) + " weight must be non-negative");
    }
}

} // anonymous namespace

void ValuationAssumptions::validate() const {
    require_finite(short_term_growth, "short_term_growth");
    require_finite(terminal_growth, "terminal_growth");
    require_finite(cost_of_equity, "cost_of_equity");
    require_finite(wacc, "wacc");
    require_finite(tax_rate, "tax_rate");
    require_finite(payout_ratio, "payout_ratio");
    if (target_roe) {
        require_finite(*target_roe, "target_roe");
    }

    if (forecast_years < 1 || forecast_years > MAX_FORECAST_YEARS) {
        throw std::invalid_argument("forecast_years must be between 1 and " +
                                    std::to_string(MAX_FORECAST_YEARS));
    }
    if (tax_rate < 0.0 || tax_rate >= 1.0) {
        throw std::invalid_argument("tax_rate must be in [0, 1)");
    }
    if (payout_ratio < 0.0 || payout_ratio > 1.0) {
        throw std::invalid_argument("payout_ratio must be in [0, 1]");
    }

    require_weight(weights.fcfe, "fcfe");
    require_weight(weights.fcff, "fcff");
    require_weight(weights.justified_pe, "justified_pe");
    require_weight(weights.justified_pb, "justified_pb");
}

bool ValuationAssumptions::set_parameter(const std::string& raw_name, double value) {
    std::string name = raw_name;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (name == "short_term_growth" || name == "growth") {
        short_term_growth = value;
    } else if (name == "terminal_growth") {
        terminal_growth = value;
    } else if (name == "cost_of_equity" || name == "required_return") {
        cost_of_equity = value;
    } else if (name == "wacc") {
        wacc = value;
    } else if (name == "tax_rate") {
        tax_rate = value;
    } else if (name == "forecast_years" || name == "years") {
        if (std::floor(value) != value) {
            throw std::invalid_argument("forecast_years must be an integer");
        }
        if (value < 1.0 || value > static_cast<double>(MAX_FORECAST_YEARS)) {
            throw std::invalid_argument("forecast_years must be between 1 and " +
                                        std::to_string(MAX_FORECAST_YEARS));
        }
        forecast_years = static_cast<int>(value);
    } else if (name == "target_roe" || name == "roe") {
        target_roe = value;
    } else if (name == "payout_ratio" || name == "payout") {
        payout_ratio = value;
    } else if (name == "weight_fcfe" || name == "fcfe") {
        weights.fcfe = value;
    } else if (name == "weight_fcff" || name == "fcff") {
        weights.fcff = value;
    } else if (name == "weight_justified_pe" || name == "justified_pe") {
        weights.justified_pe = value;
    } else if (name == "weight_justified_pb" || name == "justified_pb") {
        weights.justified_pb = value;
    } else {
        return false;
    }
    return true;
}

ValuationAssumptions ValuationAssumptions::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Assumptions must be a JSON object");
    }

    ValuationAssumptions a;
    try {
        a.short_term_growth = j.value("short_term_growth", a.short_term_growth);
        a.terminal_growth = j.value("terminal_growth", a.terminal_growth);
        a.cost_of_equity = j.value("cost_of_equity", a.cost_of_equity);
        a.wacc = j.value("wacc", a.wacc);
        a.tax_rate = j.value("tax_rate", a.tax_rate);
        a.payout_ratio = j.value("payout_ratio", a.payout_ratio);

        if (j.contains("forecast_years")) {
            const json& years = j["forecast_years"];
            if (!years.is_number_integer()) {
                throw std::invalid_argument("forecast_years must be an integer");
            }
            // Range-checked in 64 bits; unsigned values above INT64_MAX are out of range too
            int64_t count = years.is_number_unsigned() &&
                                    years.get<uint64_t>() > static_cast<uint64_t>(MAX_FORECAST_YEARS)
                ? int64_t{0}
                : years.get<int64_t>();
            if (count < 1 || count > MAX_FORECAST_YEARS) {
                throw std::invalid_argument("forecast_years must be between 1 and " +
                                            std::to_string(MAX_FORECAST_YEARS));
            }
            a.forecast_years = static_cast<int>(count);
        }

        if (j.contains("target_roe") && !j["target_roe"].is_null()) {
            a.target_roe = j["target_roe"].get<double>();
        }

        if (j.contains("model_weights")) {
            const json& w = j["model_weights"];
            if (!w.is_object()) {
                throw std::invalid_argument("model_weights must be an object");
            }
            a.weights.fcfe = w.value("fcfe", a.weights.fcfe);
            a.weights.fcff = w.value("fcff", a.weights.fcff);
            a.weights.justified_pe = w.value("justified_pe", a.weights.justified_pe);
            a.weights.justified_pb = w.value("justified_pb", a.weights.justified_pb);
        }
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid assumption value: ") + e.what());
    }

    a.validate();
    return a;
}

nlohmann::ordered_json ValuationAssumptions::to_json() const {
    nlohmann::ordered_json j;
    j["short_term_growth"] = short_term_growth;
    j["terminal_growth"] = terminal_growth;
    j["cost_of_equity"] = cost_of_equity;
    j["wacc"] = wacc;
    j["tax_rate"] = tax_rate;
    j["forecast_years"] = forecast_years;
    j["target_roe"] = target_roe ? nlohmann::ordered_json(*target_roe) : nlohmann::ordered_json(nullptr);
    j["payout_ratio"] = payout_ratio;
    j["model_weights"] = {
        {"fcfe", weights.fcfe},
        {"fcff", weights.fcff},
        {"justified_pe", weights.justified_pe},
        {"justified_pb", weights.justified_pb}
    };
    return j;
}

ValuationAssumptions ValuationAssumptions::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open assumptions file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigParseError("Failed to parse assumptions " + filepath + ": " + e.what());
    }
    return from_json(j);
}

ValuationAssumptions ValuationAssumptions::load(const std::string& filepath) {
    size_t dot = filepath.find_last_of('.');
    std::string ext = dot == std::string::npos ? "" : filepath.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (ext == "json") {
        return load_from_json(filepath);
    }
    if (ext == "csv") {
        return load_from_csv(filepath);
    }
    throw std::invalid_argument("Unsupported assumptions file type: " + filepath +
                                " (expected .json or .csv)");
}

ValuationAssumptions ValuationAssumptions::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open assumptions file: " + filepath);
    }
    return load_from_csv(file);
}

ValuationAssumptions ValuationAssumptions::load_from_csv(std::istream& is) {
    ValuationAssumptions assumptions;
    CsvReader reader(is);

    // Skip header row
    if (reader.has_more()) {
        reader.read_row();
    }

    // Expect format: name,value pairs
    // cost_of_equity,0.12
    // forecast_years,5
    // weight_fcfe,0.25
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        if (row.size() < 2) {
            throw std::runtime_error("Assumptions CSV requires columns: name,value");
        }

        double value;
        try {
            value = std::stod(row[1]);
        } catch (const std::exception&) {
            throw std::invalid_argument("Assumption '" + row[0] + "' has non-numeric value: " + row[1]);
        }

        if (!assumptions.set_parameter(row[0], value)) {
            throw std::invalid_argument("Unknown assumption: " + row[0]);
        }
    }

    assumptions.validate();
    return assumptions;
}

} // namespace fairvalue
