#include "bomcast/features/feature_builder.hpp"

#include <algorithm>
#include <stdexcept>

namespace bomcast::features {

namespace {

double trailingMean(const std::vector<double> &history, std::size_t position, int window) {
	double sum = 0.0;
	for (std::size_t i = position + 1 - static_cast<std::size_t>(window); i <= position; ++i) {
		sum += history[i];
	}
	return sum / static_cast<double>(window);
}

// Sample standard deviation (n - 1 denominator) over the trailing window.
double trailingStd(const std::vector<double> &history, std::size_t position, int window, double mean) {
	if (window < 2) {
		return kMissing;
	}
	double accum = 0.0;
	for (std::size_t i = position + 1 - static_cast<std::size_t>(window); i <= position; ++i) {
		const double diff = history[i] - mean;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(window - 1));
}

} // namespace

bool FeatureRow::complete() const {
	return missingCount() == 0;
}

std::size_t FeatureRow::missingCount() const {
	return static_cast<std::size_t>(std::count_if(values.begin(), values.end(), [](double v) { return isMissing(v); }));
}

const std::array<std::string, FeatureCount> &FeatureBuilder::featureNames() {
	static const std::array<std::string, FeatureCount> names = [] {
		std::array<std::string, FeatureCount> result;
		result[WeekOfYear] = "week_of_year";
		result[Month] = "month";
		result[Quarter] = "quarter";
		for (std::size_t i = 0; i < kLags.size(); ++i) {
			result[FirstLag + i] = "lag_" + std::to_string(kLags[i]);
		}
		for (std::size_t i = 0; i < kWindows.size(); ++i) {
			result[FirstRolling + 2 * i] = "rolling_mean_" + std::to_string(kWindows[i]);
			result[FirstRolling + 2 * i + 1] = "rolling_std_" + std::to_string(kWindows[i]);
		}
		result[YoyChange] = "yoy_change";
		result[Trend] = "trend";
		return result;
	}();
	return names;
}

void FeatureBuilder::assignCalendar(FeatureRow &row, core::WeeklySeries::TimePoint week, std::size_t trend_index) {
	row.week = week;
	row.values[WeekOfYear] = static_cast<double>(core::calendar::isoWeekOfYear(week));
	row.values[Month] = static_cast<double>(core::calendar::month(week));
	row.values[Quarter] = static_cast<double>(core::calendar::quarter(week));
	row.values[Trend] = static_cast<double>(trend_index);
}

FeatureRow FeatureBuilder::buildRow(const std::vector<double> &history, std::size_t position,
                                    core::WeeklySeries::TimePoint week) const {
	if (position >= history.size()) {
		throw std::out_of_range("Feature row position exceeds the available history.");
	}

	FeatureRow row;
	row.values.fill(kMissing);
	row.target = history[position];
	assignCalendar(row, week, position);

	for (std::size_t i = 0; i < kLags.size(); ++i) {
		const auto lag = static_cast<std::size_t>(kLags[i]);
		if (position >= lag) {
			row.values[FirstLag + i] = history[position - lag];
		}
	}

	for (std::size_t i = 0; i < kWindows.size(); ++i) {
		const int window = kWindows[i];
		if (position + 1 >= static_cast<std::size_t>(window)) {
			const double mean = trailingMean(history, position, window);
			row.values[FirstRolling + 2 * i] = mean;
			row.values[FirstRolling + 2 * i + 1] = trailingStd(history, position, window, mean);
		}
	}

	const std::size_t year_lag = static_cast<std::size_t>(kLags.back());
	if (position >= year_lag) {
		row.values[YoyChange] = history[position] - history[position - year_lag];
	}
	return row;
}

FeatureFrame FeatureBuilder::build(const core::WeeklySeries &series, const std::string &target_name) const {
	FeatureFrame frame;
	frame.target_name = target_name;
	frame.rows.reserve(series.size());

	const auto &values = series.getValues();
	const auto &weeks = series.getTimestamps();
	for (std::size_t t = 0; t < series.size(); ++t) {
		frame.rows.push_back(buildRow(values, t, weeks[t]));
	}
	return frame;
}

} // namespace bomcast::features
