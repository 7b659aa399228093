#include "json_writer.hpp"
#include "../code_codec.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace isikukood {
namespace io {

namespace {

std::ofstream open_output(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

void write_outcome(std::ostream& os, const ValidationOutcome& outcome,
                   const std::string& space) {
    os << "{\"code\":" << space << json_quote(outcome.code)
       << "," << space << "\"valid\":" << space << (outcome.valid ? "true" : "false");
    if (!outcome.valid) {
        os << "," << space << "\"error\":" << space << json_quote(outcome.error);
    }
    os << "}";
}

} // anonymous namespace

std::string json_quote(const std::string& text) {
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void write_codes_json(std::ostream& os, const std::vector<std::string>& codes,
                      bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << "{" << newline;
    os << indent << "\"count\":" << space << codes.size() << "," << newline;
    os << indent << "\"codes\":" << space << "[";
    if (!codes.empty()) {
        os << newline;
        for (size_t i = 0; i < codes.size(); ++i) {
            os << indent << indent << json_quote(codes[i]);
            if (i + 1 < codes.size()) {
                os << ",";
            }
            os << newline;
        }
        os << indent;
    }
    os << "]" << newline;
    os << "}" << newline;
}

void write_codes_json(const std::string& filepath, const std::vector<std::string>& codes,
                      bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_codes_json(file, codes, pretty_print);
}

void write_record_json(std::ostream& os, const std::string& code,
                       const IdentityRecord& record, bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << "{" << newline;
    os << indent << "\"code\":" << space << json_quote(code) << "," << newline;
    os << indent << "\"gender\":" << space << json_quote(gender_to_string(record.gender()))
       << "," << newline;
    os << indent << "\"birthdate\":" << space << json_quote(record.birthdate().to_iso())
       << "," << newline;
    os << indent << "\"sequence\":" << space << sequence_from_code(code) << "," << newline;
    os << indent << "\"checksum\":" << space << (code[10] - '0') << newline;
    os << "}" << newline;
}

void write_validation_json(std::ostream& os, const ValidationOutcome& outcome,
                           bool pretty_print) {
    write_outcome(os, outcome, pretty_print ? " " : "");
    os << "\n";
}

void write_validation_report_json(std::ostream& os,
                                  const std::vector<ValidationOutcome>& outcomes,
                                  bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    size_t valid = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.valid) ++valid;
    }

    os << "{" << newline;
    os << indent << "\"total\":" << space << outcomes.size() << "," << newline;
    os << indent << "\"valid\":" << space << valid << "," << newline;
    os << indent << "\"invalid\":" << space << (outcomes.size() - valid) << "," << newline;
    os << indent << "\"results\":" << space << "[";
    if (!outcomes.empty()) {
        os << newline;
        for (size_t i = 0; i < outcomes.size(); ++i) {
            os << indent << indent;
            write_outcome(os, outcomes[i], space);
            if (i + 1 < outcomes.size()) {
                os << ",";
            }
            os << newline;
        }
        os << indent;
    }
    os << "]" << newline;
    os << "}" << newline;
}

void write_validation_report_json(const std::string& filepath,
                                  const std::vector<ValidationOutcome>& outcomes,
                                  bool pretty_print) {
    std::ofstream file = open_output(filepath);
    write_validation_report_json(file, outcomes, pretty_print);
}

} // namespace io
} // namespace isikukood
