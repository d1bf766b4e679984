#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/core/weekly_series.hpp"
#include "bomcast/forecasting/ensemble_forecaster.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bomcast::forecasting {

struct SelectionPolicy {
	int horizon_weeks = 8;
	std::size_t min_history_weeks = 30;
	std::size_t min_active_weeks = 4;
	std::size_t activity_window_weeks = 8;
	std::size_t average_window_weeks = 8;
	/// Average-fallback totals below this are not worth forecasting.
	double min_average_total = 1.0;

	void validate() const;
};

/**
 * @struct SeriesForecast
 * @brief Forecast published for one entity together with its provenance.
 */
struct SeriesForecast {
	std::string name;
	core::ForecastMethod method = core::ForecastMethod::AverageFallback;
	std::vector<core::ForecastPoint> points;
	double total = 0.0;
	/// Mean weekly value over the average window ending at the as-of week.
	double recent_average = 0.0;
	std::size_t history_weeks = 0;
	std::size_t active_weeks = 0;
};

/**
 * @class MethodSelector
 * @brief Chooses between the ensemble and the trailing-average fallback for a
 * single series.
 *
 * Activity and averages are measured over calendar weeks ending at the
 * run-wide as-of week, so an entity that stopped selling shows zeros rather
 * than its last active weeks.
 */
class MethodSelector {
public:
	MethodSelector(SelectionPolicy policy, EnsembleForecaster ensemble);

	/// Returns nullopt when the entity is skipped.
	std::optional<SeriesForecast> forecast(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of) const;

	/**
	 * @brief Forecasts @p series but measures activity and the trailing
	 * average on @p activity.
	 *
	 * Modelling series are forward-filled across weeks without observations,
	 * while activity must see those weeks as zero; the planner passes the
	 * zero-filled series of the same observations as @p activity.
	 */
	std::optional<SeriesForecast> forecast(const core::WeeklySeries &series, const core::WeeklySeries &activity,
	                                       core::WeeklySeries::TimePoint as_of) const;

	/// Nonzero weeks among the @p window calendar weeks ending at @p as_of.
	static std::size_t activeWeeks(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of,
	                               std::size_t window);

	/// Sum over the @p window calendar weeks ending at @p as_of, divided by @p window.
	static double trailingAverage(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of,
	                              std::size_t window);

	const SelectionPolicy &policy() const {
		return policy_;
	}

private:
	SeriesForecast averageFallback(SeriesForecast base, core::WeeklySeries::TimePoint as_of) const;

	SelectionPolicy policy_;
	EnsembleForecaster ensemble_;
};

} // namespace bomcast::forecasting
