#include "config_parser.hpp"
#include "code_codec.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <limits>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace isikukood {

namespace {

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

int parse_int(const std::string& text, const std::string& item) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigParseError("Invalid list item '" + item + "': not an integer");
    }
    if (consumed != text.size()) {
        throw ConfigParseError("Invalid list item '" + item + "': not an integer");
    }
    return value;
}

void append_list_item(const std::string& raw, std::vector<int>& out) {
    std::string item = trim(raw);
    if (item.empty()) {
        throw ConfigParseError("Empty item in integer list");
    }

    // "-5" is a single (negative) value, "3-7" is a range
    size_t dash = item.find('-', 1);
    if (dash == std::string::npos) {
        out.push_back(parse_int(item, item));
        return;
    }

    int first = parse_int(trim(item.substr(0, dash)), item);
    int last = parse_int(trim(item.substr(dash + 1)), item);
    if (first > last) {
        throw ConfigParseError("Invalid range '" + item + "': start is greater than end");
    }
    long long width = static_cast<long long>(last) - first + 1;
    if (width > SEQUENCE_COUNT) {
        throw ConfigParseError("Invalid range '" + item + "': spans " + std::to_string(width) +
                               " values, at most " + std::to_string(SEQUENCE_COUNT) + " allowed");
    }
    for (long long v = first; v <= last; ++v) {
        out.push_back(static_cast<int>(v));
    }
}

int json_to_int(const json& value, const std::string& key) {
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ConfigParseError("generate." + key + " value " + std::to_string(v) +
                                   " is out of integer range");
        }
        return static_cast<int>(v);
    }
    int64_t v = value.get<int64_t>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigParseError("generate." + key + " value " + std::to_string(v) +
                               " is out of integer range");
    }
    return static_cast<int>(v);
}

// Accepts an integer, a list string ("1-5,7") or an array of either
std::vector<int> parse_int_list_json(const json& value, const std::string& key) {
    std::vector<int> result;

    if (value.is_number_integer()) {
        result.push_back(json_to_int(value, key));
    } else if (value.is_string()) {
        result = parse_int_list(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_number_integer()) {
                result.push_back(json_to_int(item, key));
            } else if (item.is_string()) {
                std::vector<int> part = parse_int_list(item.get<std::string>());
                result.insert(result.end(), part.begin(), part.end());
            } else {
                throw ConfigParseError("generate." + key + " items must be integers or range strings");
            }
        }
    } else {
        throw ConfigParseError("generate." + key + " must be an integer, a range string or an array");
    }
    return result;
}

LogLevel parse_log_level(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper != "DEBUG" && upper != "INFO" && upper != "WARN" && upper != "ERROR") {
        throw ConfigParseError("Unknown log level: " + text);
    }
    return string_to_level(upper);
}

std::string join_ints(const std::vector<int>& values) {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        oss << values[i];
    }
    return oss.str();
}

} // anonymous namespace

std::vector<int> parse_int_list(const std::string& text) {
    std::vector<int> result;
    std::stringstream ss(text);
    std::string item;

    if (trim(text).empty()) {
        throw ConfigParseError("Empty integer list");
    }

    while (std::getline(ss, item, ',')) {
        append_list_item(item, result);
    }
    // getline drops a trailing empty field
    if (text.back() == ',') {
        throw ConfigParseError("Empty item in integer list");
    }
    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    // Get directory containing config file
    fs::path config_dir = fs::path(config_file_path).parent_path();

    // Resolve relative to config directory
    fs::path resolved = config_dir / p;
    return resolved.string();
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Configuration root must be a JSON object");
        }

        // Parse generate constraints (optional)
        if (j.contains("generate")) {
            const auto& gen = j["generate"];

            if (gen.contains("genders")) {
                std::vector<Gender> genders;
                const auto& value = gen["genders"];
                if (value.is_string()) {
                    genders.push_back(parse_gender(value.get<std::string>()));
                } else if (value.is_array()) {
                    for (const auto& g : value) {
                        genders.push_back(parse_gender(g.get<std::string>()));
                    }
                } else {
                    throw ConfigParseError("generate.genders must be a string or an array of strings");
                }
                config.constraints.genders = genders;
            }
            if (gen.contains("days")) {
                config.constraints.days = parse_int_list_json(gen["days"], "days");
            }
            if (gen.contains("months")) {
                config.constraints.months = parse_int_list_json(gen["months"], "months");
            }
            if (gen.contains("years")) {
                config.constraints.years = parse_int_list_json(gen["years"], "years");
            }
            if (gen.contains("sequences")) {
                config.constraints.sequences = parse_int_list_json(gen["sequences"], "sequences");
            }
        }

        // Parse output (optional)
        if (j.contains("output")) {
            if (j["output"].contains("path")) {
                config.output.path = j["output"]["path"].get<std::string>();
            }
            if (j["output"].contains("pretty")) {
                config.output.pretty = j["output"]["pretty"].get<bool>();
            }
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            config.has_logging = true;
            const auto& logging = j["logging"];

            if (logging.contains("level")) {
                config.logging.min_level = parse_log_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.enable_file = true;
                config.logging.log_file_path = logging["file"].get<std::string>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    // Read file
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    // Resolve relative paths
    if (!config.output.path.empty()) {
        config.output.path = resolve_relative_path(config.output.path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

std::map<std::string, std::string> describe_config(const EngineConfig& config) {
    std::map<std::string, std::string> settings;
    const GenerateConstraints& c = config.constraints;

    if (c.genders) {
        std::string genders;
        for (Gender g : *c.genders) {
            genders += gender_to_string(g);
        }
        settings["genders"] = genders;
    }
    if (c.days) settings["days"] = join_ints(*c.days);
    if (c.months) settings["months"] = join_ints(*c.months);
    if (c.years) settings["years"] = join_ints(*c.years);
    if (c.sequences) settings["sequence_count"] = std::to_string(c.sequences->size());

    settings["output.path"] = config.output.path.empty() ? "stdout" : config.output.path;
    settings["output.pretty"] = config.output.pretty ? "true" : "false";
    if (config.has_logging) {
        settings["logging.level"] = level_to_string(config.logging.min_level);
        settings["logging.json"] = config.logging.enable_json ? "true" : "false";
    }
    return settings;
}

} // namespace isikukood
