#ifndef FAIRVALUE_CONFIG_PARSER_HPP
#define FAIRVALUE_CONFIG_PARSER_HPP

#include "assumptions.hpp"
#include "logger.hpp"
#include "statement.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fairvalue {

struct ValuationRequest;

/**
 * @brief Exception thrown when a configuration file cannot be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief One symbol to value, as named in a run configuration
 */
struct RequestConfig {
    std::string symbol;
    ReportingFrequency frequency = ReportingFrequency::Annual;
    std::optional<double> current_price;
    std::optional<double> shares_outstanding;

    std::string balance_sheet_path;
    std::string income_statement_path;
    std::string cash_flow_path;
    std::string ratios_path;

    std::string year_column;      ///< Period column used to order rows, empty to keep file order
    std::string quarter_column;   ///< Optional sub-period column

    const std::string& path_for(StatementKind kind) const;
};

/**
 * @brief A complete batch run: shared assumptions, logging and the requests
 */
struct RunConfig {
    ValuationAssumptions assumptions;
    std::string assumptions_path;        ///< When set, assumptions are loaded from this file
    std::string field_catalog_path;      ///< Empty for the built-in catalog
    LoggerConfig logging;
    double recommendation_threshold_pct = 10.0;
    std::vector<RequestConfig> requests;
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative statement, catalog, assumptions and log file paths resolve against
 * the directory containing the configuration file.
 *
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid, or
 *         the referenced assumptions file cannot be loaded
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Paths are kept as written (after environment expansion).
 *
 * @throws ConfigParseError if the JSON is invalid or a required field is missing
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Loads the statements named by a request configuration
 *
 * Missing statement paths leave that statement empty. When year_column is set,
 * every statement that carries that column is re-ordered most recent first.
 *
 * @throws std::runtime_error if a statement file cannot be read
 */
ValuationRequest load_request(const RequestConfig& request, const ValuationAssumptions& assumptions);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute and empty paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace fairvalue

#endif // FAIRVALUE_CONFIG_PARSER_HPP
