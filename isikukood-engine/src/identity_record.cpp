#include "identity_record.hpp"
#include "calendar.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace isikukood {

std::string gender_to_string(Gender gender) {
    return gender == Gender::Male ? "m" : "f";
}

Gender parse_gender(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "m" || lower == "male") {
        return Gender::Male;
    }
    if (lower == "f" || lower == "female") {
        return Gender::Female;
    }
    throw RangeError("expected gender to be either m or f, got '" + text + "'");
}

// ============================================================================
// BirthDate
// ============================================================================

std::string BirthDate::to_iso() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    return oss.str();
}

BirthDate BirthDate::from_iso(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw FormatError("date '" + text + "' is not in YYYY-MM-DD form");
    }

    std::string yyyy = text.substr(0, 4);
    std::string mm = text.substr(5, 2);
    std::string dd = text.substr(8, 2);
    if (!is_numeric(yyyy) || !is_numeric(mm) || !is_numeric(dd)) {
        throw FormatError("date '" + text + "' is not in YYYY-MM-DD form");
    }

    return BirthDate{std::stoi(yyyy), std::stoi(mm), std::stoi(dd)};
}

bool BirthDate::operator==(const BirthDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool BirthDate::operator<(const BirthDate& other) const {
    return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
}

// ============================================================================
// IdentityRecord
// ============================================================================

IdentityRecord::IdentityRecord(Gender gender, const BirthDate& birthdate)
    : gender_(gender), birthdate_(birthdate) {
    if (gender_ != Gender::Male && gender_ != Gender::Female) {
        throw RangeError("gender value " + std::to_string(static_cast<int>(gender_)) +
                         " is neither male nor female");
    }
    if (!year_in_range(birthdate_.year)) {
        throw RangeError("expected year to be between " + std::to_string(MIN_YEAR) +
                         " and " + std::to_string(MAX_YEAR) + " (incl.), got " +
                         std::to_string(birthdate_.year));
    }
    if (!date_exists(birthdate_.year, birthdate_.month, birthdate_.day)) {
        throw SemanticError("date " + birthdate_.to_iso() + " does not exist");
    }
}

IdentityRecord::IdentityRecord(Gender gender, int year, int month, int day)
    : IdentityRecord(gender, BirthDate{year, month, day}) {}

IdentityRecord IdentityRecord::with_gender(Gender gender) const {
    return IdentityRecord(gender, birthdate_);
}

IdentityRecord IdentityRecord::with_birthdate(const BirthDate& birthdate) const {
    return IdentityRecord(gender_, birthdate);
}

bool IdentityRecord::operator==(const IdentityRecord& other) const {
    return gender_ == other.gender_ && birthdate_ == other.birthdate_;
}

std::ostream& operator<<(std::ostream& os, const BirthDate& date) {
    return os << date.to_iso();
}

std::ostream& operator<<(std::ostream& os, const IdentityRecord& record) {
    return os << "{" << gender_to_string(record.gender()) << ", " << record.birthdate() << "}";
}

} // namespace isikukood
