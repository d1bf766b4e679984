#include "bomcast/forecasting/method_selector.hpp"

#include "bomcast/utils/logging.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace bomcast::forecasting {

namespace {

// Values of the calendar weeks (as_of - window, as_of]; weeks outside the
// series count as zero.
std::vector<double> windowValues(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of,
                                 std::size_t window) {
	std::vector<double> values(window, 0.0);
	const auto end = core::calendar::weekStart(as_of);
	for (std::size_t i = 0; i < window; ++i) {
		const auto week = core::calendar::addWeeks(end, -static_cast<int>(window - 1 - i));
		if (auto index = series.indexOf(week)) {
			values[i] = series.getValues()[*index];
		}
	}
	return values;
}

// Drops weeks after the as-of week.
core::WeeklySeries clipTo(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of) {
	const auto end = core::calendar::weekStart(as_of);
	if (series.empty() || series.lastWeek() <= end) {
		return series;
	}
	if (series.firstWeek() > end) {
		return series.slice(0, 0);
	}
	return series.slice(0, *series.indexOf(end) + 1);
}

} // namespace

void SelectionPolicy::validate() const {
	if (horizon_weeks <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	if (activity_window_weeks == 0 || average_window_weeks == 0) {
		throw std::invalid_argument("Activity and average windows must be positive.");
	}
	if (min_active_weeks > activity_window_weeks) {
		throw std::invalid_argument("Minimum active weeks cannot exceed the activity window.");
	}
	if (min_average_total < 0.0) {
		throw std::invalid_argument("Minimum average total must be non-negative.");
	}
}

MethodSelector::MethodSelector(SelectionPolicy policy, EnsembleForecaster ensemble)
    : policy_(policy), ensemble_(std::move(ensemble)) {
	policy_.validate();
}

std::size_t MethodSelector::activeWeeks(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of,
                                        std::size_t window) {
	const auto values = windowValues(series, as_of, window);
	return static_cast<std::size_t>(std::count_if(values.begin(), values.end(), [](double v) { return v != 0.0; }));
}

double MethodSelector::trailingAverage(const core::WeeklySeries &series, core::WeeklySeries::TimePoint as_of,
                                       std::size_t window) {
	if (window == 0) {
		return 0.0;
	}
	const auto values = windowValues(series, as_of, window);
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(window);
}

SeriesForecast MethodSelector::averageFallback(SeriesForecast base, core::WeeklySeries::TimePoint as_of) const {
	base.method = core::ForecastMethod::AverageFallback;
	base.total = base.recent_average * policy_.horizon_weeks;
	const double published = core::roundToTenth(std::max(0.0, base.recent_average));
	base.points.clear();
	const auto start = core::calendar::weekStart(as_of);
	for (int i = 0; i < policy_.horizon_weeks; ++i) {
		core::ForecastPoint point;
		point.week = core::calendar::addWeeks(start, i + 1);
		point.forecast = published;
		point.low = published;
		point.high = published;
		base.points.push_back(point);
	}
	return base;
}

std::optional<SeriesForecast> MethodSelector::forecast(const core::WeeklySeries &input,
                                                       core::WeeklySeries::TimePoint as_of) const {
	return forecast(input, input, as_of);
}

std::optional<SeriesForecast> MethodSelector::forecast(const core::WeeklySeries &input,
                                                       const core::WeeklySeries &activity,
                                                       core::WeeklySeries::TimePoint as_of) const {
	const auto series = clipTo(input, as_of);
	SeriesForecast result;
	result.name = input.label();
	result.history_weeks = series.size();
	result.active_weeks = activeWeeks(activity, as_of, policy_.activity_window_weeks);
	result.recent_average = trailingAverage(activity, as_of, policy_.average_window_weeks);

	if (series.empty() || result.active_weeks < policy_.min_active_weeks) {
		BOMCAST_DEBUG("Skipping '{}': {} active of the last {} weeks.", result.name, result.active_weeks,
		              policy_.activity_window_weeks);
		return std::nullopt;
	}

	if (result.history_weeks >= policy_.min_history_weeks) {
		const auto aligned = series.extendedTo(as_of);
		const auto ensemble = ensemble_.forecast(aligned, policy_.horizon_weeks);
		if (!ensemble.points.empty()) {
			result.method = ensemble.method();
			result.points = ensemble.points;
			result.total = std::accumulate(result.points.begin(), result.points.end(), 0.0,
			                               [](double acc, const core::ForecastPoint &p) { return acc + p.forecast; });
			BOMCAST_DEBUG("'{}' forecast by {} ({} weeks of history).", result.name, core::toString(result.method),
			              result.history_weeks);
			return result;
		}
		BOMCAST_DEBUG("No model produced a forecast for '{}'; using the trailing average.", result.name);
	}

	result = averageFallback(std::move(result), as_of);
	if (result.total < policy_.min_average_total) {
		BOMCAST_DEBUG("Skipping '{}': average-fallback total {:.2f} is negligible.", result.name, result.total);
		return std::nullopt;
	}
	BOMCAST_DEBUG("'{}' forecast by {} ({} weeks of history).", result.name, core::toString(result.method),
	              result.history_weeks);
	return result;
}

} // namespace bomcast::forecasting
