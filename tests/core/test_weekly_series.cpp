#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/core/weekly_series.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>
#include <vector>

using bomcast::core::WeeklySeries;
using namespace bomcast::core::calendar;

TEST_CASE("WeeklySeries validates cadence", "[core][weekly_series]") {
	const auto weeks = tests::helpers::makeWeeks(3);
	REQUIRE_NOTHROW(WeeklySeries(weeks, {1.0, 2.0, 3.0}));
	REQUIRE_THROWS_AS(WeeklySeries(weeks, {1.0, 2.0}), std::invalid_argument);

	auto gapped = weeks;
	gapped[2] = addWeeks(gapped[1], 2);
	REQUIRE_THROWS_AS(WeeklySeries(gapped, {1.0, 2.0, 3.0}), std::invalid_argument);

	auto unaligned = weeks;
	unaligned[0] = fromCivil(2023, 12, 26);
	REQUIRE_THROWS_AS(WeeklySeries(unaligned, {1.0, 2.0, 3.0}), std::invalid_argument);
}

TEST_CASE("fromObservations aligns, sums and forward-fills", "[core][weekly_series]") {
	std::vector<WeeklySeries::Observation> observations = {
	    {fromCivil(2024, 1, 17), 4.0}, // Wednesday of week 3
	    {fromCivil(2024, 1, 3), 2.0},  // week 1
	    {fromCivil(2024, 1, 5), 3.0},  // same week, summed
	};
	const auto series = WeeklySeries::fromObservations(observations, WeeklySeries::GapFill::ForwardFill, "sku");

	REQUIRE(series.label() == "sku");
	REQUIRE(series.size() == 3);
	REQUIRE(series.firstWeek() == fromCivil(2024, 1, 1));
	REQUIRE(series.lastWeek() == fromCivil(2024, 1, 15));
	REQUIRE(series.getValues()[0] == Catch::Approx(5.0));
	REQUIRE(series.getValues()[1] == Catch::Approx(5.0));
	REQUIRE(series.getValues()[2] == Catch::Approx(4.0));

	const auto zero_filled = WeeklySeries::fromObservations(observations, WeeklySeries::GapFill::Zero);
	REQUIRE(zero_filled.getValues()[1] == Catch::Approx(0.0));
}

TEST_CASE("WeeklySeries slicing and extension", "[core][weekly_series]") {
	const auto series = tests::helpers::makeWeeklySeries({1.0, 2.0, 3.0, 4.0});

	REQUIRE(series.indexOf(addWeeks(series.firstWeek(), 2)) == std::optional<std::size_t>(2));
	REQUIRE_FALSE(series.indexOf(addWeeks(series.lastWeek(), 1)).has_value());

	const auto tail = series.tail(2);
	REQUIRE(tail.size() == 2);
	REQUIRE(tail.getValues().front() == Catch::Approx(3.0));
	REQUIRE(series.tail(10).size() == 4);
	REQUIRE_THROWS_AS(series.slice(3, 2), std::out_of_range);

	const auto extended = series.extendedTo(addWeeks(series.lastWeek(), 2));
	REQUIRE(extended.size() == 6);
	REQUIRE(extended.getValues()[4] == Catch::Approx(0.0));
	REQUIRE(extended.getValues()[5] == Catch::Approx(0.0));
	REQUIRE(series.extendedTo(series.firstWeek()).size() == 4);

	const WeeklySeries empty;
	REQUIRE_THROWS_AS(empty.lastWeek(), std::out_of_range);
}
