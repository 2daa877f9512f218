/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace fairvalue {

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level_str +
                                " (expected DEBUG, INFO, WARN or ERROR)");
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::map<std::string, std::string> Logger::context_fields(
    const std::string& event,
    const ValuationContext& ctx
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["symbol"] = ctx.symbol;
    if (!ctx.model.empty()) {
        fields["model"] = ctx.model;
    }
    if (!ctx.phase.empty()) {
        fields["phase"] = ctx.phase;
    }
    return fields;
}

void Logger::log_valuation_start(
    const ValuationContext& ctx,
    const std::string& frequency,
    size_t period_count
) {
    auto fields = context_fields("valuation_start", ctx);
    fields["frequency"] = frequency;
    fields["period_count"] = std::to_string(period_count);

    log(LogLevel::INFO, "Starting valuation", fields);
}

void Logger::log_field_unresolved(
    const ValuationContext& ctx,
    const std::string& metric,
    const std::string& statement
) {
    auto fields = context_fields("field_unresolved", ctx);
    fields["metric"] = metric;
    fields["statement"] = statement;

    log(LogLevel::DEBUG, "No candidate label resolved", fields);
}

void Logger::log_unit_rescaled(
    const ValuationContext& ctx,
    const std::string& metric,
    double original_value,
    double rescaled_value
) {
    auto fields = context_fields("unit_rescaled", ctx);
    fields["metric"] = metric;
    fields["original_value"] = format_number(original_value);
    fields["rescaled_value"] = format_number(rescaled_value);

    log(LogLevel::WARN, "Implausible unit rescaled", fields);
}

void Logger::log_model_fallback(
    const ValuationContext& ctx,
    const std::string& reason,
    double value_per_share
) {
    auto fields = context_fields("model_fallback", ctx);
    fields["reason"] = reason;
    fields["value_per_share"] = format_number(value_per_share);

    log(LogLevel::WARN, "Model used fallback multiple", fields);
}

void Logger::log_model_failed(
    const ValuationContext& ctx,
    const std::string& reason
) {
    auto fields = context_fields("model_failed", ctx);
    fields["reason"] = reason;

    log(LogLevel::WARN, "Model produced no value", fields);
}

void Logger::log_valuation_complete(
    const ValuationContext& ctx,
    double weighted_average,
    size_t models_used,
    double execution_time_ms
) {
    auto fields = context_fields("valuation_complete", ctx);
    fields["weighted_average"] = format_number(weighted_average);
    fields["models_used"] = std::to_string(models_used);
    fields["execution_time_ms"] = format_number(execution_time_ms);

    log(LogLevel::INFO, "Valuation completed", fields);
}

void Logger::log_error(const ValuationContext& ctx, const std::string& error_message) {
    auto fields = context_fields("error", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Valuation error", fields);
}

void Logger::log_warning(const ValuationContext& ctx, const std::string& warning_message) {
    auto fields = context_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string Logger::format_number(double value) const {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace fairvalue
