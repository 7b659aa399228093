/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace isikukood {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_operation_start(const OperationContext& ctx) {
    std::map<std::string, std::string> fields;
    fields["event"] = "operation_start";
    fields["operation"] = ctx.operation;
    if (!ctx.input.empty()) {
        fields["input"] = ctx.input;
    }

    log(LogLevel::INFO, "Starting " + ctx.operation, fields);
}

void Logger::log_operation_complete(
    const OperationContext& ctx,
    size_t result_count,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "operation_complete";
    fields["operation"] = ctx.operation;
    if (!ctx.input.empty()) {
        fields["input"] = ctx.input;
    }
    fields["result_count"] = std::to_string(result_count);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Completed " + ctx.operation, fields);
}

void Logger::log_generation_complete(
    const OperationContext& ctx,
    const GenerationStats& stats
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "generation_complete";
    fields["operation"] = ctx.operation;
    fields["dates_considered"] = std::to_string(stats.dates_considered);
    fields["dates_pruned"] = std::to_string(stats.dates_pruned);
    fields["records"] = std::to_string(stats.records);
    fields["codes"] = std::to_string(stats.codes);
    fields["threads"] = std::to_string(stats.threads);
    fields["elapsed_ms"] = std::to_string(stats.elapsed_ms);
    fields["throughput_codes_per_sec"] = std::to_string(
        stats.elapsed_ms > 0 ? (stats.codes * 1000.0 / stats.elapsed_ms) : 0
    );

    log(LogLevel::INFO, "Generation completed", fields);
}

void Logger::log_config_loaded(
    const std::string& config_path,
    const std::map<std::string, std::string>& settings
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["config_path"] = config_path;
    for (const auto& [key, value] : settings) {
        fields["config." + key] = value;
    }

    log(LogLevel::DEBUG, "Configuration loaded", fields);
}

void Logger::log_input_rejected(
    const OperationContext& ctx,
    const std::string& error_kind,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "input_rejected";
    fields["operation"] = ctx.operation;
    if (!ctx.input.empty()) {
        fields["input"] = ctx.input;
    }
    fields["error_kind"] = error_kind;
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Input rejected", fields);
}

void Logger::log_consistency_failure(
    const OperationContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "internal_consistency_failure";
    fields["operation"] = ctx.operation;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Internal consistency failure (engine defect)", fields);
}

void Logger::log_error(
    const OperationContext& ctx,
    const std::string& error_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["operation"] = ctx.operation;
    if (!ctx.input.empty()) {
        fields["input"] = ctx.input;
    }
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Operation failed", fields);
}

void Logger::flush() {
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
    // Skip if below minimum level
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
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

// Invalid UTF-8 (a CSV row, a rejected code) is replaced with U+FFFD
std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    nlohmann::json j(fields);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace isikukood
