#pragma once

#include "bomcast/core/weekly_series.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace bomcast::features {

/// Lags (in weeks) and trailing rolling windows materialised for every row.
constexpr std::array<int, 7> kLags = {1, 2, 3, 4, 8, 12, 52};
constexpr std::array<int, 3> kWindows = {4, 8, 12};

/// Column positions inside FeatureRow::values.
enum FeatureIndex : std::size_t {
	WeekOfYear = 0,
	Month = 1,
	Quarter = 2,
	FirstLag = 3,
	Lag1 = FirstLag,
	FirstRolling = FirstLag + kLags.size(),
	YoyChange = FirstRolling + 2 * kWindows.size(),
	Trend = YoyChange + 1,
	FeatureCount = Trend + 1
};

constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool isMissing(double value) {
	return std::isnan(value);
}

/**
 * @struct FeatureRow
 * @brief Engineered features for one week plus the target observed that week.
 *
 * Lag and rolling features without enough prior history hold kMissing; the
 * calendar fields and trend are always defined.
 */
struct FeatureRow {
	core::WeeklySeries::TimePoint week;
	double target = 0.0;
	std::array<double, FeatureCount> values{};

	bool complete() const;
	std::size_t missingCount() const;
};

struct FeatureFrame {
	std::string target_name;
	std::vector<FeatureRow> rows;
};

/**
 * @class FeatureBuilder
 * @brief Derives calendar, lag, rolling and year-over-year features from a
 * weekly series.
 *
 * Rows are never dropped here; row i is aligned with week i of the input.
 * Rolling windows are trailing and include the current week.
 */
class FeatureBuilder {
public:
	static const std::array<std::string, FeatureCount> &featureNames();

	FeatureFrame build(const core::WeeklySeries &series, const std::string &target_name = "units") const;

	/**
	 * @brief Builds the row for @p position given the values observed (or
	 * predicted) up to and including that position.
	 *
	 * @p history must contain at least position + 1 values; only the prefix is
	 * read.
	 */
	FeatureRow buildRow(const std::vector<double> &history, std::size_t position,
	                    core::WeeklySeries::TimePoint week) const;

	/// Sets the calendar fields and trend of @p row for @p week.
	static void assignCalendar(FeatureRow &row, core::WeeklySeries::TimePoint week, std::size_t trend_index);
};

} // namespace bomcast::features
