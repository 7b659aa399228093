#ifndef ISIKUKOOD_CALENDAR_HPP
#define ISIKUKOOD_CALENDAR_HPP

namespace isikukood {

// Supported birth year window (inclusive), covered by markers 1-8
constexpr int MIN_YEAR = 1800;
constexpr int MAX_YEAR = 2199;

// Gregorian leap year rule: divisible by 4, except centuries not divisible by 400
bool is_leap_year(int year);

// Number of days in the month, or 0 if month is not in 1-12
int days_in_month(int year, int month);

// True iff (year, month, day) is a real Gregorian calendar date
bool date_exists(int year, int month, int day);

// True iff MIN_YEAR <= year <= MAX_YEAR
bool year_in_range(int year);

// Current calendar year in local time
int current_year();

} // namespace isikukood

#endif // ISIKUKOOD_CALENDAR_HPP
