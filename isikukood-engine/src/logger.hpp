/**
 * @file logger.hpp
 * @brief Structured logging for the identity code engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing, or plain text
 * - Context tracking (operation name and input)
 * - Distinct events for rejected input and internal consistency failures
 *
 * Console output goes to stderr; stdout is reserved for results.
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef ISIKUKOOD_LOGGER_HPP
#define ISIKUKOOD_LOGGER_HPP

#include "enumerator.hpp"
#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <fstream>
#include <mutex>

namespace isikukood {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (configuration, intermediate counts)
    INFO,    ///< Informational messages (operation start/end, generation summary)
    WARN,    ///< Warning messages (rejected input)
    ERROR    ///< Error messages (failures, engine defects)
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
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Operation context for logging
 */
struct OperationContext {
    std::string operation;           ///< Operation name (decode, encode, generate, ...)
    std::string input;               ///< Primary input (code, base, config path), may be empty

    OperationContext() : operation(""), input("") {}

    explicit OperationContext(const std::string& op, const std::string& in = "")
        : operation(op), input(in) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("isikukood.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "isikukood.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   OperationContext ctx("generate");
 *   logger.log_operation_start(ctx);
 *   GenerationStats stats;
 *   auto codes = generate(constraints, &stats);
 *   logger.log_generation_complete(ctx, stats);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of a consumer operation
     */
    void log_operation_start(const OperationContext& ctx);

    /**
     * @brief Log the completion of a consumer operation
     *
     * @param ctx Operation context
     * @param result_count Number of codes/records produced
     * @param elapsed_ms Wall time of the operation
     */
    void log_operation_complete(
        const OperationContext& ctx,
        size_t result_count,
        double elapsed_ms
    );

    /**
     * @brief Log enumerator summary
     */
    void log_generation_complete(
        const OperationContext& ctx,
        const GenerationStats& stats
    );

    /**
     * @brief Log configuration file contents after parsing
     *
     * @param config_path Path to the configuration file
     * @param settings Flattened key/value view of the parsed settings
     */
    void log_config_loaded(
        const std::string& config_path,
        const std::map<std::string, std::string>& settings
    );

    /**
     * @brief Log input rejected with a Format/Range/Semantic error
     *
     * @param ctx Operation context
     * @param error_kind "format", "range" or "semantic"
     * @param error_message Error message
     */
    void log_input_rejected(
        const OperationContext& ctx,
        const std::string& error_kind,
        const std::string& error_message
    );

    /**
     * @brief Log an internal consistency failure (engine defect)
     *
     * @param ctx Operation context
     * @param error_message Description of the failed re-validation
     */
    void log_consistency_failure(
        const OperationContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log error with context
     *
     * @param ctx Operation context
     * @param error_message Error message
     */
    void log_error(
        const OperationContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     *
     * @param level Minimum level to output
     */
    void set_min_level(LogLevel level) { config_.min_level = level; }

    /**
     * @brief Get current log level
     *
     * @return Current minimum log level
     */
    LogLevel get_min_level() const { return config_.min_level; }

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
    std::mutex write_mutex_;         ///< Serializes output from enumerator worker threads

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace isikukood

#endif // ISIKUKOOD_LOGGER_HPP
