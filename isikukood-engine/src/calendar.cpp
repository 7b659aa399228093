#include "calendar.hpp"
#include <array>
#include <chrono>
#include <ctime>

namespace isikukood {

namespace {

constexpr std::array<int, 12> MONTH_LENGTHS = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

} // anonymous namespace

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return MONTH_LENGTHS[month - 1];
}

bool date_exists(int year, int month, int day) {
    return day >= 1 && day <= days_in_month(year, month);
}

bool year_in_range(int year) {
    return year >= MIN_YEAR && year <= MAX_YEAR;
}

int current_year() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    return tm_buf.tm_year + 1900;
}

} // namespace isikukood
