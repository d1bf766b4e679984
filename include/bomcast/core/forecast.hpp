#pragma once

#include "bomcast/core/calendar.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace bomcast::core {

/**
 * @struct Forecast
 * @brief Raw multi-step output of a single model.
 *
 * Holds the point path and, when the model provides one, a two-sided
 * prediction interval of the same length. Values are unclamped.
 */
struct Forecast {
	using Series = std::vector<double>;

	Series point;
	std::optional<Series> lower;
	std::optional<Series> upper;

	bool empty() const {
		return point.empty();
	}

	std::size_t horizon() const {
		return point.size();
	}

	bool hasInterval() const {
		return lower.has_value() && upper.has_value();
	}

	/// Sets both interval bounds, checking they line up with the point path.
	void setInterval(Series lower_bounds, Series upper_bounds) {
		if (lower_bounds.size() != point.size() || upper_bounds.size() != point.size()) {
			throw std::invalid_argument("Interval bounds must match the forecast horizon.");
		}
		lower = std::move(lower_bounds);
		upper = std::move(upper_bounds);
	}
};

/// Provenance tag recorded for every forecast run.
enum class ForecastMethod {
	Seasonal,
	Tree,
	Ensemble,
	AverageFallback
};

const char *toString(ForecastMethod method);

/// Inverse of toString; throws std::invalid_argument for unknown tags.
ForecastMethod parseForecastMethod(const std::string &tag);

/**
 * @struct ForecastPoint
 * @brief A single published forecast week.
 *
 * forecast, low and high are non-negative and rounded to one decimal by the
 * stage that produces them.
 */
struct ForecastPoint {
	calendar::TimePoint week;
	double forecast = 0.0;
	double low = 0.0;
	double high = 0.0;
};

/// Rounds to one decimal place, half away from zero.
double roundToTenth(double value);

/// Rounds to @p digits decimals, half away from zero.
double roundTo(double value, int digits);

} // namespace bomcast::core
