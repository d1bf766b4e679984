#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/core/model_result.hpp"
#include "bomcast/models/tree_forecaster.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>

using bomcast::models::RecursiveMode;
using bomcast::models::TreeConfig;
using bomcast::models::TreeForecaster;

TEST_CASE("Tree forecaster needs twenty complete feature rows", "[models][tree]") {
	TreeForecaster model;
	// lag_52 first exists at row 52, so 71 weeks give 19 complete rows.
	REQUIRE_THROWS_AS(model.fit(tests::helpers::constantSeries(71, 10.0)), bomcast::core::InsufficientHistoryError);
	REQUIRE_THROWS_AS(model.fit(tests::helpers::constantSeries(52, 10.0)), bomcast::core::InsufficientHistoryError);
	REQUIRE_NOTHROW(model.fit(tests::helpers::constantSeries(72, 10.0)));
	REQUIRE(model.trainingRows() == 20);
}

TEST_CASE("Carry-forward recursion reproduces a constant series", "[models][tree][carry-forward]") {
	TreeForecaster model;
	model.fit(tests::helpers::constantSeries(80, 10.0));
	const auto forecast = model.predict(8);
	REQUIRE(forecast.horizon() == 8);
	REQUIRE_FALSE(forecast.hasInterval());
	for (double value : forecast.point) {
		REQUIRE(value == Catch::Approx(10.0));
	}
}

TEST_CASE("Recompute recursion reproduces a constant series", "[models][tree][recompute]") {
	TreeConfig config;
	config.mode = RecursiveMode::Recompute;
	TreeForecaster model(config);
	model.fit(tests::helpers::constantSeries(80, 10.0));
	for (double value : model.predict(8).point) {
		REQUIRE(value == Catch::Approx(10.0));
	}
}

TEST_CASE("Both recursion modes give non-negative, reproducible paths", "[models][tree][carry-forward][recompute]") {
	const auto series = tests::helpers::makeWeeklySeries(tests::helpers::seasonalValues(120, 8.0, 10.0, -0.05));
	for (auto mode : {RecursiveMode::CarryForward, RecursiveMode::Recompute}) {
		TreeConfig config;
		config.mode = mode;
		TreeForecaster first(config);
		TreeForecaster second(config);
		first.fit(series);
		second.fit(series);
		const auto a = first.predict(12);
		const auto b = second.predict(12);
		REQUIRE(a.horizon() == 12);
		for (std::size_t h = 0; h < a.horizon(); ++h) {
			REQUIRE(a.point[h] >= 0.0);
			REQUIRE(a.point[h] == b.point[h]);
		}
	}
}

TEST_CASE("Tree forecaster guards its state and configuration", "[models][tree]") {
	TreeForecaster model;
	REQUIRE_THROWS_AS(model.predict(4), std::runtime_error);

	TreeConfig bad;
	bad.min_training_rows = 0;
	REQUIRE_THROWS_AS(TreeForecaster(bad), std::invalid_argument);
	bad = TreeConfig{};
	bad.learning_rate = 0.0;
	REQUIRE_THROWS_AS(TreeForecaster(bad), std::invalid_argument);

	model.fit(tests::helpers::constantSeries(80, 3.0));
	REQUIRE(model.predict(0).empty());
}
