#include <catch2/catch_test_macros.hpp>

#include "bomcast/core/calendar.hpp"

#include <stdexcept>

using namespace bomcast::core::calendar;

TEST_CASE("ISO dates round-trip through time points", "[core][calendar]") {
	const auto tp = parseIsoDate("2024-02-29");
	REQUIRE(formatIsoDate(tp) == "2024-02-29");
	REQUIRE(toCivil(tp).year == 2024);
	REQUIRE(toCivil(tp).month == 2u);
	REQUIRE(toCivil(tp).day == 29u);
	REQUIRE(formatIsoDate(parseIsoDate("2023-06-05T13:45:00Z")) == "2023-06-05");
}

TEST_CASE("Invalid ISO dates are rejected", "[core][calendar]") {
	REQUIRE_THROWS_AS(parseIsoDate("2023-02-29"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseIsoDate("2023-13-01"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseIsoDate("03/01/2023"), std::invalid_argument);
	REQUIRE_THROWS_AS(parseIsoDate(""), std::invalid_argument);
}

TEST_CASE("Weeks start on Monday", "[core][calendar][week]") {
	const auto monday = fromCivil(2024, 1, 1);
	REQUIRE(weekday(monday) == 0);
	REQUIRE(weekday(fromCivil(2024, 1, 7)) == 6);
	REQUIRE(weekStart(fromCivil(2024, 1, 7)) == monday);
	REQUIRE(weekStart(fromCivil(2024, 1, 4)) == monday);
	REQUIRE(weekStart(monday) == monday);
	REQUIRE(weekStart(fromCivil(2024, 1, 8)) == fromCivil(2024, 1, 8));
}

TEST_CASE("Week arithmetic", "[core][calendar][week]") {
	const auto start = fromCivil(2023, 12, 25);
	REQUIRE(addWeeks(start, 1) == fromCivil(2024, 1, 1));
	REQUIRE(addWeeks(start, -52) == fromCivil(2022, 12, 26));
	REQUIRE(weeksBetween(start, addWeeks(start, 10)) == 10);
	REQUIRE(weeksBetween(addWeeks(start, 10), start) == -10);
}

TEST_CASE("Calendar fields follow ISO week numbering", "[core][calendar]") {
	REQUIRE(isoWeekOfYear(fromCivil(2024, 1, 1)) == 1);
	REQUIRE(isoWeekOfYear(fromCivil(2021, 1, 3)) == 53);
	REQUIRE(isoWeekOfYear(fromCivil(2020, 12, 28)) == 53);
	REQUIRE(isoWeekOfYear(fromCivil(2019, 12, 30)) == 1);
	REQUIRE(month(fromCivil(2024, 5, 20)) == 5);
	REQUIRE(quarter(fromCivil(2024, 5, 20)) == 2);
	REQUIRE(quarter(fromCivil(2024, 12, 31)) == 4);
}
