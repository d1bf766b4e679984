#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/forecasting/ensemble_forecaster.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>

using bomcast::core::Forecast;
using bomcast::core::ForecastMethod;
using bomcast::core::ModelResult;
using bomcast::core::UnavailableReason;
using bomcast::forecasting::EnsembleConfig;
using bomcast::forecasting::EnsembleForecast;
using bomcast::forecasting::EnsembleForecaster;
using bomcast::forecasting::SeasonalAdapter;
using bomcast::forecasting::TreeAdapter;

namespace {

using Result = ModelResult<Forecast>;

Result seasonalResult(std::vector<double> point, std::vector<double> lower, std::vector<double> upper) {
	Forecast forecast;
	forecast.point = std::move(point);
	forecast.setInterval(std::move(lower), std::move(upper));
	return Result::available(forecast);
}

Result treeResult(std::vector<double> point) {
	Forecast forecast;
	forecast.point = std::move(point);
	return Result::available(forecast);
}

Result missing() {
	return Result::unavailable(UnavailableReason::InsufficientHistory, "too short");
}

} // namespace

TEST_CASE("Blend weights both models and keeps the seasonal interval", "[forecasting][ensemble]") {
	const auto last = tests::helpers::firstMonday();
	const auto points = EnsembleForecaster::blend(seasonalResult({10.0, 20.0}, {8.0, 15.0}, {17.0, 25.0}),
	                                              treeResult({20.0, 30.0}), last, 2, EnsembleConfig{});
	REQUIRE(points.size() == 2);
	REQUIRE(points[0].forecast == Catch::Approx(16.0));
	REQUIRE(points[0].low == Catch::Approx(8.0));
	REQUIRE(points[0].high == Catch::Approx(17.0));
	REQUIRE(points[0].week == bomcast::core::calendar::addWeeks(last, 1));

	// 0.4 * 20 + 0.6 * 30 = 26 lies above the seasonal band, which widens to hold it.
	REQUIRE(points[1].forecast == Catch::Approx(26.0));
	REQUIRE(points[1].low == Catch::Approx(15.0));
	REQUIRE(points[1].high == Catch::Approx(26.0));
	REQUIRE(points[1].week == bomcast::core::calendar::addWeeks(last, 2));
}

TEST_CASE("A single model uses its own value and a fallback band", "[forecasting][ensemble]") {
	const auto last = tests::helpers::firstMonday();

	SECTION("tree only") {
		const auto points = EnsembleForecaster::blend(missing(), treeResult({10.0, 5.0}), last, 2, EnsembleConfig{});
		REQUIRE(points.size() == 2);
		REQUIRE(points[0].forecast == Catch::Approx(10.0));
		REQUIRE(points[0].low == Catch::Approx(8.0));
		REQUIRE(points[0].high == Catch::Approx(12.0));
		REQUIRE(points[1].low == Catch::Approx(4.0));
		REQUIRE(points[1].high == Catch::Approx(6.0));
	}

	SECTION("seasonal only") {
		const auto points =
		    EnsembleForecaster::blend(seasonalResult({10.0}, {7.0}, {13.0}), missing(), last, 1, EnsembleConfig{});
		REQUIRE(points.size() == 1);
		REQUIRE(points[0].forecast == Catch::Approx(10.0));
		REQUIRE(points[0].low == Catch::Approx(7.0));
		REQUIRE(points[0].high == Catch::Approx(13.0));
	}
}

TEST_CASE("Steps no model covers are omitted", "[forecasting][ensemble]") {
	const auto last = tests::helpers::firstMonday();
	REQUIRE(EnsembleForecaster::blend(missing(), missing(), last, 4, EnsembleConfig{}).empty());

	const auto points = EnsembleForecaster::blend(treeResult({3.0}), missing(), last, 3, EnsembleConfig{});
	REQUIRE(points.size() == 1);
	REQUIRE(points[0].week == bomcast::core::calendar::addWeeks(last, 1));
}

TEST_CASE("Published values are clamped at zero and rounded", "[forecasting][ensemble]") {
	const auto last = tests::helpers::firstMonday();
	const auto points = EnsembleForecaster::blend(seasonalResult({-3.0, 12.345}, {-5.0, 11.04}, {1.0, 13.66}),
	                                              missing(), last, 2, EnsembleConfig{});
	REQUIRE(points.size() == 2);
	REQUIRE(points[0].forecast == 0.0);
	REQUIRE(points[0].low == 0.0);
	REQUIRE(points[0].high == Catch::Approx(1.0));
	REQUIRE(points[1].forecast == Catch::Approx(12.3));
	REQUIRE(points[1].low == Catch::Approx(11.0));
	REQUIRE(points[1].high == Catch::Approx(13.7));
	for (const auto &point : points) {
		REQUIRE(point.low <= point.forecast);
		REQUIRE(point.forecast <= point.high);
	}
}

TEST_CASE("Ensemble provenance follows model availability", "[forecasting][ensemble]") {
	EnsembleForecast forecast;
	REQUIRE(forecast.method() == ForecastMethod::AverageFallback);
	forecast.tree_available = true;
	REQUIRE(forecast.method() == ForecastMethod::Tree);
	forecast.seasonal_available = true;
	REQUIRE(forecast.method() == ForecastMethod::Ensemble);
	forecast.tree_available = false;
	REQUIRE(forecast.method() == ForecastMethod::Seasonal);
}

TEST_CASE("Eighty weeks of history fall back to the tree alone", "[forecasting][ensemble]") {
	// The 52-week seasonal model needs more than 80 weeks.
	EnsembleForecaster ensemble(SeasonalAdapter{}, TreeAdapter{});
	const auto series = tests::helpers::constantSeries(80, 10.0);
	const auto result = ensemble.forecast(series, 8);

	REQUIRE_FALSE(result.seasonal_available);
	REQUIRE(result.tree_available);
	REQUIRE(result.method() == ForecastMethod::Tree);
	REQUIRE(result.points.size() == 8);
	for (std::size_t i = 0; i < result.points.size(); ++i) {
		const auto &point = result.points[i];
		REQUIRE(point.forecast == Catch::Approx(10.0));
		REQUIRE(point.low == Catch::Approx(8.0));
		REQUIRE(point.high == Catch::Approx(12.0));
		REQUIRE(point.week == bomcast::core::calendar::addWeeks(series.lastWeek(), static_cast<int>(i) + 1));
	}
}

TEST_CASE("Ensemble config rejects inconsistent weights", "[forecasting][ensemble]") {
	EnsembleConfig config;
	REQUIRE_NOTHROW(config.validate());
	config.seasonal_weight = 0.5;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
	config = EnsembleConfig{};
	config.fallback_band = 1.0;
	REQUIRE_THROWS_AS(EnsembleForecaster(SeasonalAdapter{}, TreeAdapter{}, config), std::invalid_argument);
}

TEST_CASE("Two and a half seasonal years blend both models", "[forecasting][ensemble]") {
	// SARIMA(1,1,1)(1,1,0)[52] needs 116 weeks and the tree 72.
	EnsembleForecaster ensemble(SeasonalAdapter{}, TreeAdapter{});
	const auto series = tests::helpers::makeWeeklySeries(tests::helpers::seasonalValues(130), "seasonal");
	const auto result = ensemble.forecast(series, 8);

	REQUIRE(result.seasonal_available);
	REQUIRE(result.tree_available);
	REQUIRE(result.method() == ForecastMethod::Ensemble);
	REQUIRE(result.points.size() == 8);
	for (const auto &point : result.points) {
		REQUIRE(point.low >= 0.0);
		REQUIRE(point.low <= point.forecast);
		REQUIRE(point.forecast <= point.high);
	}
}
