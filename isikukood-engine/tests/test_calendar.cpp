#include <catch2/catch_test_macros.hpp>
#include "calendar.hpp"

using namespace isikukood;

TEST_CASE("Leap years follow the Gregorian rule", "[calendar]") {
    REQUIRE(is_leap_year(2000));
    REQUIRE(is_leap_year(2004));
    REQUIRE(is_leap_year(1804));
    REQUIRE_FALSE(is_leap_year(1900));
    REQUIRE_FALSE(is_leap_year(2100));
    REQUIRE_FALSE(is_leap_year(2001));
}

TEST_CASE("Days in month", "[calendar]") {
    REQUIRE(days_in_month(2001, 1) == 31);
    REQUIRE(days_in_month(2001, 2) == 28);
    REQUIRE(days_in_month(2000, 2) == 29);
    REQUIRE(days_in_month(1900, 2) == 28);
    REQUIRE(days_in_month(2001, 4) == 30);
    REQUIRE(days_in_month(2001, 12) == 31);

    SECTION("Invalid month") {
        REQUIRE(days_in_month(2001, 0) == 0);
        REQUIRE(days_in_month(2001, 13) == 0);
    }
}

TEST_CASE("Date existence", "[calendar]") {
    REQUIRE(date_exists(2000, 2, 29));
    REQUIRE_FALSE(date_exists(2001, 2, 29));
    REQUIRE_FALSE(date_exists(2000, 4, 31));
    REQUIRE(date_exists(2000, 12, 31));
    REQUIRE_FALSE(date_exists(2000, 1, 0));
    REQUIRE_FALSE(date_exists(2000, 0, 1));
    REQUIRE_FALSE(date_exists(2000, 1, 32));
}

TEST_CASE("Supported year window", "[calendar]") {
    REQUIRE(year_in_range(1800));
    REQUIRE(year_in_range(2199));
    REQUIRE_FALSE(year_in_range(1799));
    REQUIRE_FALSE(year_in_range(2200));
    REQUIRE(year_in_range(current_year()));
}
