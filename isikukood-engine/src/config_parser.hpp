#ifndef ISIKUKOOD_CONFIG_PARSER_HPP
#define ISIKUKOOD_CONFIG_PARSER_HPP

#include "enumerator.hpp"
#include "logger.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace isikukood {

/**
 * @brief Exception thrown when config file or list argument parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Where and how results are written
 */
struct OutputSettings {
    std::string path;     ///< Output file; empty means stdout
    bool pretty;          ///< Pretty-print JSON output

    OutputSettings() : path(""), pretty(true) {}
};

/**
 * @brief Parsed engine configuration
 */
struct EngineConfig {
    GenerateConstraints constraints;
    OutputSettings output;
    LoggerConfig logging;
    bool has_logging;     ///< True if the file had a "logging" section

    EngineConfig() : has_logging(false) {}
};

/**
 * @brief Parses an integer list such as "1-5,10,12"
 *
 * Items are comma-separated; each is an integer or an inclusive range "a-b"
 * with a <= b. A leading minus sign makes the item a single negative value,
 * which the enumerator then rejects as out of range. A range may span at most
 * SEQUENCE_COUNT values, the size of the widest constraint domain.
 *
 * @throws ConfigParseError on empty items, non-numeric text, reversed or
 *         oversized ranges
 */
std::vector<int> parse_int_list(const std::string& text);

/**
 * @brief Parses a configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if JSON is invalid or has unexpected types
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Parses a configuration from a JSON file
 *
 * Relative output and log file paths are resolved against the directory of
 * the configuration file.
 *
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

/**
 * @brief Flattened key/value view of a configuration, for logging
 */
std::map<std::string, std::string> describe_config(const EngineConfig& config);

} // namespace isikukood

#endif // ISIKUKOOD_CONFIG_PARSER_HPP
