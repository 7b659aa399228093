#ifndef ISIKUKOOD_CHECKSUM_HPP
#define ISIKUKOOD_CHECKSUM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace isikukood {

constexpr size_t CODE_LENGTH = 11;
constexpr size_t BASE_LENGTH = 10;

// Stage 1 weights over digits d0..d9
constexpr std::array<int, BASE_LENGTH> PRIMARY_WEIGHTS = {1, 2, 3, 4, 5, 6, 7, 8, 9, 1};
// Stage 2 weights, used only when stage 1 leaves remainder 10
constexpr std::array<int, BASE_LENGTH> SECONDARY_WEIGHTS = {3, 4, 5, 6, 7, 8, 9, 1, 2, 3};

// True if every character is an ASCII digit and the string is non-empty
bool is_numeric(const std::string& s);

// Calculate the check digit of a 10-digit base (or an 11-digit code, in which
// case the last digit is ignored).
// Weighted sum mod 11 with PRIMARY_WEIGHTS; if that gives 10, repeat with
// SECONDARY_WEIGHTS; if that also gives 10 the check digit is 0.
// Throws FormatError unless the input is 10 or 11 ASCII digits.
uint8_t calculate_checksum(const std::string& base);

// Return the first 10 characters of `code` followed by a freshly computed
// check digit. Accepts 10 characters, or 11 where the last one is overwritten
// (any character). Throws FormatError if the first 10 are not digits.
std::string insert_checksum(const std::string& code);

} // namespace isikukood

#endif // ISIKUKOOD_CHECKSUM_HPP
