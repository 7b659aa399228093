#ifndef ISIKUKOOD_IDENTITY_RECORD_HPP
#define ISIKUKOOD_IDENTITY_RECORD_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace isikukood {

enum class Gender : uint8_t {
    Male = 0,
    Female = 1
};

// "m" or "f"
std::string gender_to_string(Gender gender);

// Accepts m, f, male, female in any case. Throws RangeError otherwise.
Gender parse_gender(const std::string& text);

// Calendar date with ISO 8601 (YYYY-MM-DD) text form.
// Holds any triple; validity is enforced by IdentityRecord.
struct BirthDate {
    int year;
    int month;
    int day;

    std::string to_iso() const;

    // Throws FormatError unless text is exactly YYYY-MM-DD with digits
    static BirthDate from_iso(const std::string& text);

    bool operator==(const BirthDate& other) const;
    bool operator!=(const BirthDate& other) const { return !(*this == other); }
    bool operator<(const BirthDate& other) const;
};

// Validated (gender, birth date) pair. Immutable: the with_* methods return a
// new record and re-run validation.
class IdentityRecord {
public:
    // Throws RangeError if the year is outside [MIN_YEAR, MAX_YEAR] and
    // SemanticError if the date does not exist.
    IdentityRecord(Gender gender, const BirthDate& birthdate);
    IdentityRecord(Gender gender, int year, int month, int day);

    Gender gender() const { return gender_; }
    const BirthDate& birthdate() const { return birthdate_; }

    IdentityRecord with_gender(Gender gender) const;
    IdentityRecord with_birthdate(const BirthDate& birthdate) const;

    bool operator==(const IdentityRecord& other) const;
    bool operator!=(const IdentityRecord& other) const { return !(*this == other); }

private:
    Gender gender_;
    BirthDate birthdate_;
};

std::ostream& operator<<(std::ostream& os, const BirthDate& date);
std::ostream& operator<<(std::ostream& os, const IdentityRecord& record);

} // namespace isikukood

#endif // ISIKUKOOD_IDENTITY_RECORD_HPP
