#include "config_parser.hpp"
#include "valuation.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace fairvalue {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference is left as written
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            // A lone '$' is literal text
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

const std::string& RequestConfig::path_for(StatementKind kind) const {
    switch (kind) {
        case StatementKind::BalanceSheet: return balance_sheet_path;
        case StatementKind::IncomeStatement: return income_statement_path;
        case StatementKind::CashFlow: return cash_flow_path;
        case StatementKind::Ratios: return ratios_path;
    }
    throw std::invalid_argument("Unknown statement kind");
}

namespace {

std::string read_path(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return "";
    }
    return expand_environment_variables(j[key].get<std::string>());
}

std::optional<double> read_optional_number(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

RequestConfig parse_request(const json& j) {
    if (!j.contains("symbol")) {
        throw ConfigParseError("Request missing required field: symbol");
    }

    RequestConfig request;
    request.symbol = j["symbol"].get<std::string>();
    if (request.symbol.empty()) {
        throw ConfigParseError("Request symbol must not be empty");
    }

    if (j.contains("frequency")) {
        try {
            request.frequency = frequency_from_string(j["frequency"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError("Request '" + request.symbol + "': " + e.what());
        }
    }

    request.current_price = read_optional_number(j, "current_price");
    request.shares_outstanding = read_optional_number(j, "shares_outstanding");

    if (j.contains("statements")) {
        const json& statements = j["statements"];
        request.balance_sheet_path = read_path(statements, "balance_sheet");
        request.income_statement_path = read_path(statements, "income_statement");
        request.cash_flow_path = read_path(statements, "cash_flow");
        request.ratios_path = read_path(statements, "ratios");
    }

    if (j.contains("period_columns")) {
        const json& periods = j["period_columns"];
        request.year_column = periods.value("year", std::string());
        request.quarter_column = periods.value("quarter", std::string());
    }

    return request;
}

LoggerConfig parse_logging(const json& j) {
    LoggerConfig logging;
    if (j.contains("level")) {
        try {
            logging.min_level = string_to_level(j["level"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(e.what());
        }
    }
    if (j.contains("file") && !j["file"].is_null()) {
        logging.enable_file = true;
        logging.log_file_path = expand_environment_variables(j["file"].get<std::string>());
    }
    logging.enable_json = j.value("json", logging.enable_json);
    logging.enable_console = j.value("console", logging.enable_console);
    return logging;
}

} // anonymous namespace

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (j.contains("assumptions")) {
            const json& assumptions = j["assumptions"];
            if (assumptions.is_string()) {
                config.assumptions_path = expand_environment_variables(assumptions.get<std::string>());
            } else {
                try {
                    config.assumptions = ValuationAssumptions::from_json(assumptions);
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(std::string("Invalid assumptions: ") + e.what());
                }
            }
        }

        config.field_catalog_path = read_path(j, "field_catalog");

        if (j.contains("logging")) {
            config.logging = parse_logging(j["logging"]);
        }

        config.recommendation_threshold_pct =
            j.value("recommendation_threshold_pct", config.recommendation_threshold_pct);
        if (config.recommendation_threshold_pct < 0.0) {
            throw ConfigParseError("recommendation_threshold_pct must be non-negative");
        }

        if (!j.contains("requests") || !j["requests"].is_array()) {
            throw ConfigParseError("Missing required field: requests");
        }
        for (const auto& request_json : j["requests"]) {
            config.requests.push_back(parse_request(request_json));
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    // Resolve relative paths
    config.field_catalog_path = resolve_relative_path(config.field_catalog_path, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }
    for (auto& request : config.requests) {
        request.balance_sheet_path = resolve_relative_path(request.balance_sheet_path, file_path);
        request.income_statement_path = resolve_relative_path(request.income_statement_path, file_path);
        request.cash_flow_path = resolve_relative_path(request.cash_flow_path, file_path);
        request.ratios_path = resolve_relative_path(request.ratios_path, file_path);
    }

    if (!config.assumptions_path.empty()) {
        config.assumptions_path = resolve_relative_path(config.assumptions_path, file_path);
        try {
            config.assumptions = ValuationAssumptions::load(config.assumptions_path);
        } catch (const ConfigParseError&) {
            throw;
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError("Invalid assumptions file " + config.assumptions_path + ": " + e.what());
        } catch (const std::runtime_error& e) {
            throw ConfigParseError("Cannot load assumptions file " + config.assumptions_path + ": " + e.what());
        }
    }

    return config;
}

ValuationRequest load_request(const RequestConfig& request, const ValuationAssumptions& assumptions) {
    ValuationRequest out;
    out.market.symbol = request.symbol;
    out.market.current_price = request.current_price;
    out.market.shares_outstanding = request.shares_outstanding;
    out.assumptions = assumptions;
    out.statements.frequency = request.frequency;

    constexpr StatementKind kinds[] = {
        StatementKind::BalanceSheet, StatementKind::IncomeStatement,
        StatementKind::CashFlow, StatementKind::Ratios
    };

    for (StatementKind kind : kinds) {
        const std::string& path = request.path_for(kind);
        if (path.empty()) {
            continue;
        }

        StatementTable table = StatementTable::load(path);
        if (!request.year_column.empty()) {
            FieldLabel year = FieldLabel::parse(request.year_column);
            if (table.find_column(year)) {
                std::optional<FieldLabel> quarter;
                if (!request.quarter_column.empty()) {
                    FieldLabel q = FieldLabel::parse(request.quarter_column);
                    if (table.find_column(q)) {
                        quarter = q;
                    }
                }
                table.order_by_period(year, quarter);
            }
        }
        out.statements.get(kind) = std::move(table);
    }

    return out;
}

} // namespace fairvalue
