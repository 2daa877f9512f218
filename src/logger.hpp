/**
 * @file logger.hpp
 * @brief Structured logging for the valuation engine
 *
 * The Logger provides structured logging with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text lines on stderr and/or a log file
 * - Context tracking (symbol, model, pipeline phase)
 * - One method per valuation event so every line carries an "event" field
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef FAIRVALUE_LOGGER_HPP
#define FAIRVALUE_LOGGER_HPP

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <fstream>

namespace fairvalue {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Field resolution details
    INFO,    ///< Valuation start/end
    WARN,    ///< Unit rescaling, model fallbacks and failures
    ERROR    ///< Request-level failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-sensitive, upper case)
 *
 * @throws std::invalid_argument if the string names no level
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Valuation context attached to every event
 */
struct ValuationContext {
    std::string symbol;   ///< Ticker being valued
    std::string model;    ///< Valuation model, empty outside model evaluation
    std::string phase;    ///< Pipeline phase (extract, normalize, model, aggregate)

    ValuationContext() = default;

    explicit ValuationContext(const std::string& sym, const std::string& ph = "")
        : symbol(sym), model(""), phase(ph) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (opened in append mode)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("fairvalue.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   ValuationContext ctx("VNM", "model");
 *   ctx.model = "fcfe";
 *   Logger::get_instance().log_model_failed(ctx, "cost of equity <= terminal growth");
 *   @endcode
 *
 * All public methods are safe to call from concurrent batch workers.
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of one symbol's valuation
     *
     * @param frequency Reporting frequency of the statements ("year"/"quarter")
     * @param period_count Number of period rows in the income statement
     */
    void log_valuation_start(
        const ValuationContext& ctx,
        const std::string& frequency,
        size_t period_count
    );

    /**
     * @brief Log a canonical metric that no candidate label resolved
     */
    void log_field_unresolved(
        const ValuationContext& ctx,
        const std::string& metric,
        const std::string& statement
    );

    /**
     * @brief Log a unit reconciliation (e.g. share count reported in units of 1/1000)
     */
    void log_unit_rescaled(
        const ValuationContext& ctx,
        const std::string& metric,
        double original_value,
        double rescaled_value
    );

    /**
     * @brief Log a model that fell back to its fixed multiple
     */
    void log_model_fallback(
        const ValuationContext& ctx,
        const std::string& reason,
        double value_per_share
    );

    /**
     * @brief Log a model that produced no usable value
     */
    void log_model_failed(
        const ValuationContext& ctx,
        const std::string& reason
    );

    /**
     * @brief Log the end of one symbol's valuation
     */
    void log_valuation_complete(
        const ValuationContext& ctx,
        double weighted_average,
        size_t models_used,
        double execution_time_ms
    );

    void log_error(const ValuationContext& ctx, const std::string& error_message);

    void log_warning(const ValuationContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    std::map<std::string, std::string> context_fields(
        const std::string& event, const ValuationContext& ctx) const;
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    std::string format_number(double value) const;
    void write_output(const std::string& output);
};

} // namespace fairvalue

#endif // FAIRVALUE_LOGGER_HPP
