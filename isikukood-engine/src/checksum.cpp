#include "checksum.hpp"
#include "errors.hpp"
#include <algorithm>

namespace isikukood {

namespace {

int weighted_remainder(const std::string& base, const std::array<int, BASE_LENGTH>& weights) {
    int sum = 0;
    for (size_t i = 0; i < BASE_LENGTH; ++i) {
        sum += (base[i] - '0') * weights[i];
    }
    return sum % 11;
}

} // anonymous namespace

bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

uint8_t calculate_checksum(const std::string& base) {
    if (base.size() != BASE_LENGTH && base.size() != CODE_LENGTH) {
        throw FormatError("'" + base + "' is " + std::to_string(base.size()) +
                          " digits, expected 10 or 11");
    }
    if (!is_numeric(base)) {
        throw FormatError("'" + base + "' is not numeric");
    }

    int remainder = weighted_remainder(base, PRIMARY_WEIGHTS);
    if (remainder < 10) {
        return static_cast<uint8_t>(remainder);
    }

    remainder = weighted_remainder(base, SECONDARY_WEIGHTS);
    if (remainder < 10) {
        return static_cast<uint8_t>(remainder);
    }
    return 0;
}

std::string insert_checksum(const std::string& code) {
    if (code.size() != BASE_LENGTH && code.size() != CODE_LENGTH) {
        throw FormatError("'" + code + "' is " + std::to_string(code.size()) +
                          " characters, expected 10 or 11");
    }

    std::string base = code.substr(0, BASE_LENGTH);
    if (!is_numeric(base)) {
        throw FormatError("first 10 characters of '" + code + "' are not numeric");
    }
    return base + static_cast<char>('0' + calculate_checksum(base));
}

} // namespace isikukood
