/**
 * @file code_codec.hpp
 * @brief Conversion between IdentityRecord and the 11-digit identity code
 *
 * Code layout (positions):
 *
 * | Pos  | Field                          | Domain     |
 * |------|--------------------------------|------------|
 * | 0    | century/gender marker          | 1-8        |
 * | 1-2  | year within century            | 00-99      |
 * | 3-4  | month                          | 01-12      |
 * | 5-6  | day                            | 01-31      |
 * | 7-9  | sequence number                | 000-999    |
 * | 10   | check digit                    | 0-9        |
 *
 * Marker table: 1/2 = 1800s, 3/4 = 1900s, 5/6 = 2000s, 7/8 = 2100s.
 * Odd markers are male, even markers are female.
 *
 * Every construction routine (encode, construct_many, construct_all) re-decodes
 * its own output before returning and throws InternalConsistencyError if that
 * fails. Input problems are reported with FormatError, RangeError or
 * SemanticError.
 */

#ifndef ISIKUKOOD_CODE_CODEC_HPP
#define ISIKUKOOD_CODE_CODEC_HPP

#include "identity_record.hpp"
#include <string>
#include <vector>

namespace isikukood {

constexpr int MIN_SEQUENCE = 0;
constexpr int MAX_SEQUENCE = 999;
constexpr int SEQUENCE_COUNT = MAX_SEQUENCE - MIN_SEQUENCE + 1;

/**
 * @brief Marker digit (1-8) for a birth year and gender
 *
 * @throws RangeError if year is outside [MIN_YEAR, MAX_YEAR]
 */
int gender_marker(int year, Gender gender);

/**
 * @brief Fully validate a code and return the record it encodes
 *
 * Checks, in order: 11 ASCII digits (FormatError), marker 1-8 (RangeError),
 * year window (RangeError), date existence (SemanticError), check digit
 * (SemanticError).
 */
IdentityRecord decode(const std::string& code);

/**
 * @brief True if decode() would succeed
 *
 * Input errors yield false. InternalConsistencyError is never raised here.
 */
bool is_valid(const std::string& code);

/**
 * @brief Encode a record and sequence number into an 11-digit code
 *
 * @throws RangeError if sequence is outside [0, 999]
 */
std::string encode(const IdentityRecord& record, int sequence);

/**
 * @brief Encode a record with each sequence number, preserving input order
 *
 * Fail-fast: the first invalid entry in input order is reported (RangeError
 * for out-of-range values, SemanticError for a value listed twice) and no
 * codes are returned.
 */
std::vector<std::string> construct_many(const IdentityRecord& record,
                                        const std::vector<int>& sequences);

/**
 * @brief All 1000 codes of a record, sequence 0 to 999 ascending
 */
std::vector<std::string> construct_all(const IdentityRecord& record);

/// @name Field extraction (no check digit verification)

/** @brief Gender from marker parity. FormatError / RangeError on bad shape or marker. */
Gender gender_from_code(const std::string& code);

/** @brief Birth date from marker and date fields. Validates marker, year window and date. */
BirthDate birthdate_from_code(const std::string& code);

/** @brief Sequence number at positions 7-9. FormatError on bad shape. */
int sequence_from_code(const std::string& code);

/// @name Consistency checks

/**
 * @brief Verify that codes are duplicate-free and each one decodes
 *
 * @throws InternalConsistencyError on the first violation (logged at ERROR)
 */
void assert_codec_consistency(const std::vector<std::string>& codes);

/**
 * @brief As above, and every code must decode to `expected`
 */
void assert_codec_consistency(const std::vector<std::string>& codes,
                              const IdentityRecord& expected);

} // namespace isikukood

#endif // ISIKUKOOD_CODE_CODEC_HPP
