#include "code_codec.hpp"
#include "calendar.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace isikukood {

namespace {

struct MarkerEntry {
    int century;
    Gender gender;
};

// MARKER_TABLE[marker - 1]
constexpr std::array<MarkerEntry, 8> MARKER_TABLE = {{
    {1800, Gender::Male},
    {1800, Gender::Female},
    {1900, Gender::Male},
    {1900, Gender::Female},
    {2000, Gender::Male},
    {2000, Gender::Female},
    {2100, Gender::Male},
    {2100, Gender::Female},
}};

int two_digits(const std::string& code, size_t pos) {
    return (code[pos] - '0') * 10 + (code[pos + 1] - '0');
}

void require_code_shape(const std::string& code) {
    if (!code.empty() && !is_numeric(code)) {
        throw FormatError("'" + code + "' is not numeric");
    }
    if (code.size() != CODE_LENGTH) {
        throw FormatError("'" + code + "' is " + std::to_string(code.size()) +
                          " digits, expected 11");
    }
}

const MarkerEntry& marker_entry(const std::string& code) {
    int marker = code[0] - '0';
    if (marker < 1 || marker > 8) {
        throw RangeError("'" + code + "' begins with a " + std::to_string(marker) +
                         ", expected a value between 1 and 8 (incl.)");
    }
    return MARKER_TABLE[marker - 1];
}

void require_sequence_range(int sequence) {
    if (sequence < MIN_SEQUENCE || sequence > MAX_SEQUENCE) {
        throw RangeError("sequence number was " + std::to_string(sequence) +
                         ", expected a value between 0 and 999 (incl.)");
    }
}

// Unchecked: caller guarantees a valid record and sequence
std::string format_code(const IdentityRecord& record, int sequence) {
    const BirthDate& date = record.birthdate();

    std::ostringstream oss;
    oss << gender_marker(date.year, record.gender())
        << std::setfill('0')
        << std::setw(2) << (date.year % 100)
        << std::setw(2) << date.month
        << std::setw(2) << date.day
        << std::setw(3) << sequence;

    std::string base = oss.str();
    return base + static_cast<char>('0' + calculate_checksum(base));
}

[[noreturn]] void report_inconsistency(const std::string& message) {
    Logger::get_instance().log_consistency_failure(
        OperationContext("consistency_check"), message);
    throw InternalConsistencyError(message);
}

IdentityRecord decode_or_report(const std::string& code) {
    try {
        return decode(code);
    } catch (const InputError& e) {
        report_inconsistency("produced code " + code + " fails validation: " + e.what());
    }
}

// expected may be null when codes belong to several records
void check_codes(const std::vector<std::string>& codes, const IdentityRecord* expected) {
    // Sorted input (generate) is checked in place
    if (std::is_sorted(codes.begin(), codes.end())) {
        auto dup = std::adjacent_find(codes.begin(), codes.end());
        if (dup != codes.end()) {
            report_inconsistency("duplicate code " + *dup);
        }
    } else {
        std::unordered_set<std::string> unique;
        unique.reserve(codes.size());
        for (const auto& code : codes) {
            if (!unique.insert(code).second) {
                report_inconsistency("duplicate code " + code);
            }
        }
    }

    for (const auto& code : codes) {
        IdentityRecord decoded = decode_or_report(code);
        if (expected && decoded != *expected) {
            std::ostringstream oss;
            oss << "code " << code << " decodes to " << decoded << ", expected " << *expected;
            report_inconsistency(oss.str());
        }
    }
}

} // anonymous namespace

int gender_marker(int year, Gender gender) {
    if (!year_in_range(year)) {
        throw RangeError("expected year to be between " + std::to_string(MIN_YEAR) +
                         " and " + std::to_string(MAX_YEAR) + " (incl.), got " +
                         std::to_string(year));
    }

    int century = (year / 100) * 100;
    for (size_t i = 0; i < MARKER_TABLE.size(); ++i) {
        if (MARKER_TABLE[i].century == century && MARKER_TABLE[i].gender == gender) {
            return static_cast<int>(i) + 1;
        }
    }
    throw RangeError("no marker for year " + std::to_string(year) + " and gender " +
                     gender_to_string(gender));
}

Gender gender_from_code(const std::string& code) {
    require_code_shape(code);
    marker_entry(code);
    return (code[0] - '0') % 2 == 1 ? Gender::Male : Gender::Female;
}

BirthDate birthdate_from_code(const std::string& code) {
    require_code_shape(code);
    const MarkerEntry& entry = marker_entry(code);

    BirthDate date{entry.century + two_digits(code, 1), two_digits(code, 3), two_digits(code, 5)};

    if (!year_in_range(date.year)) {
        throw RangeError("year " + std::to_string(date.year) + " in '" + code +
                         "' is outside " + std::to_string(MIN_YEAR) + "-" +
                         std::to_string(MAX_YEAR));
    }
    if (!date_exists(date.year, date.month, date.day)) {
        throw SemanticError("date " + date.to_iso() + " in '" + code + "' does not exist");
    }
    return date;
}

int sequence_from_code(const std::string& code) {
    require_code_shape(code);
    return std::stoi(code.substr(7, 3));
}

IdentityRecord decode(const std::string& code) {
    BirthDate date = birthdate_from_code(code);
    Gender gender = gender_from_code(code);

    uint8_t expected = calculate_checksum(code);
    if (code[10] - '0' != expected) {
        throw SemanticError("invalid checksum for '" + code + "', expected " +
                            std::to_string(expected));
    }
    return IdentityRecord(gender, date);
}

bool is_valid(const std::string& code) {
    try {
        decode(code);
        return true;
    } catch (const InputError&) {
        return false;
    }
}

std::string encode(const IdentityRecord& record, int sequence) {
    require_sequence_range(sequence);

    std::string code = format_code(record, sequence);
    assert_codec_consistency({code}, record);
    return code;
}

std::vector<std::string> construct_many(const IdentityRecord& record,
                                        const std::vector<int>& sequences) {
    std::vector<bool> seen(SEQUENCE_COUNT, false);
    std::vector<std::string> codes;
    codes.reserve(sequences.size());

    for (int sequence : sequences) {
        require_sequence_range(sequence);
        if (seen[sequence]) {
            throw SemanticError("sequence number " + std::to_string(sequence) +
                                " is listed more than once");
        }
        seen[sequence] = true;
        codes.push_back(format_code(record, sequence));
    }

    for (size_t i = 0; i < codes.size(); ++i) {
        if (sequence_from_code(codes[i]) != sequences[i]) {
            report_inconsistency("code " + codes[i] + " does not carry sequence number " +
                                 std::to_string(sequences[i]));
        }
    }
    assert_codec_consistency(codes, record);
    return codes;
}

std::vector<std::string> construct_all(const IdentityRecord& record) {
    std::vector<int> sequences(SEQUENCE_COUNT);
    for (int i = 0; i < SEQUENCE_COUNT; ++i) {
        sequences[i] = MIN_SEQUENCE + i;
    }
    return construct_many(record, sequences);
}

void assert_codec_consistency(const std::vector<std::string>& codes) {
    check_codes(codes, nullptr);
}

void assert_codec_consistency(const std::vector<std::string>& codes,
                              const IdentityRecord& expected) {
    check_codes(codes, &expected);
}

} // namespace isikukood
