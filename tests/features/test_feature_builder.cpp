#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/features/feature_builder.hpp"
#include "common/series_helpers.hpp"

#include <cmath>
#include <numeric>
#include <vector>

using namespace bomcast::features;

namespace {

std::vector<double> ramp(std::size_t count) {
	std::vector<double> values(count);
	std::iota(values.begin(), values.end(), 1.0);
	return values;
}

} // namespace

TEST_CASE("FeatureBuilder keeps one row per week", "[features]") {
	const auto series = tests::helpers::makeWeeklySeries(ramp(60));
	const auto frame = FeatureBuilder().build(series, "orders");

	REQUIRE(frame.target_name == "orders");
	REQUIRE(frame.rows.size() == 60);
	for (std::size_t i = 0; i < frame.rows.size(); ++i) {
		REQUIRE(frame.rows[i].week == series.getTimestamps()[i]);
		REQUIRE(frame.rows[i].values[Trend] == Catch::Approx(static_cast<double>(i)));
	}
	REQUIRE(FeatureBuilder::featureNames()[Lag1] == "lag_1");
	REQUIRE(FeatureBuilder::featureNames()[YoyChange] == "yoy_change");
	REQUIRE(FeatureBuilder::featureNames()[FeatureCount - 1] == "trend");
}

TEST_CASE("Lag features are missing only where history is short", "[features][lags]") {
	const auto frame = FeatureBuilder().build(tests::helpers::makeWeeklySeries(ramp(60)));

	const auto &first = frame.rows[0];
	REQUIRE(isMissing(first.values[Lag1]));
	REQUIRE_FALSE(isMissing(first.values[WeekOfYear]));
	REQUIRE_FALSE(first.complete());

	const auto &row10 = frame.rows[10];
	REQUIRE(row10.values[Lag1] == Catch::Approx(10.0));
	REQUIRE(row10.values[FirstLag + 4] == Catch::Approx(3.0)); // lag_8
	REQUIRE(isMissing(row10.values[FirstLag + 5]));              // lag_12
	REQUIRE(isMissing(row10.values[YoyChange]));

	REQUIRE_FALSE(frame.rows[51].complete());
	REQUIRE(frame.rows[52].complete());
	REQUIRE(frame.rows[52].values[YoyChange] == Catch::Approx(52.0));
	REQUIRE(frame.rows[52].missingCount() == 0);
}

TEST_CASE("Rolling windows are trailing and include the current week", "[features][rolling]") {
	const auto frame = FeatureBuilder().build(tests::helpers::makeWeeklySeries({2.0, 4.0, 6.0, 8.0, 10.0}));

	REQUIRE(isMissing(frame.rows[2].values[FirstRolling]));
	const auto &row = frame.rows[3];
	REQUIRE(row.values[FirstRolling] == Catch::Approx(5.0));
	// Sample standard deviation of {2, 4, 6, 8}.
	REQUIRE(row.values[FirstRolling + 1] == Catch::Approx(std::sqrt(20.0 / 3.0)));
	REQUIRE(frame.rows[4].values[FirstRolling] == Catch::Approx(7.0));
	REQUIRE(isMissing(frame.rows[4].values[FirstRolling + 2])); // rolling_mean_8
}

TEST_CASE("Calendar features describe the week start", "[features][calendar]") {
	FeatureRow row;
	FeatureBuilder::assignCalendar(row, bomcast::core::calendar::fromCivil(2024, 4, 1), 12);
	REQUIRE(row.values[WeekOfYear] == Catch::Approx(14.0));
	REQUIRE(row.values[Month] == Catch::Approx(4.0));
	REQUIRE(row.values[Quarter] == Catch::Approx(2.0));
	REQUIRE(row.values[Trend] == Catch::Approx(12.0));
}
