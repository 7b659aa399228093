#ifndef ISIKUKOOD_IO_JSON_WRITER_HPP
#define ISIKUKOOD_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <vector>
#include "../identity_record.hpp"

namespace isikukood {
namespace io {

// Result of validating one code from a batch
struct ValidationOutcome {
    std::string code;
    bool valid;
    std::string error;      // empty when valid
    std::string error_kind; // "format", "range" or "semantic" when invalid
};

// {"count": N, "codes": [...]}
void write_codes_json(std::ostream& os, const std::vector<std::string>& codes,
                      bool pretty_print = true);

void write_codes_json(const std::string& filepath, const std::vector<std::string>& codes,
                      bool pretty_print = true);

// {"code", "gender", "birthdate", "sequence", "checksum"} for a decoded code
void write_record_json(std::ostream& os, const std::string& code,
                       const IdentityRecord& record, bool pretty_print = true);

// {"code", "valid", "error"?} for a single validation
void write_validation_json(std::ostream& os, const ValidationOutcome& outcome,
                           bool pretty_print = true);

// {"total", "valid", "invalid", "results": [...]}
void write_validation_report_json(std::ostream& os,
                                  const std::vector<ValidationOutcome>& outcomes,
                                  bool pretty_print = true);

void write_validation_report_json(const std::string& filepath,
                                  const std::vector<ValidationOutcome>& outcomes,
                                  bool pretty_print = true);

// JSON string literal with quotes and escapes, invalid UTF-8 replaced with U+FFFD
std::string json_quote(const std::string& text);

} // namespace io
} // namespace isikukood

#endif // ISIKUKOOD_IO_JSON_WRITER_HPP
