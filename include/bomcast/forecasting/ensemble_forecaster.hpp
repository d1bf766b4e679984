#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/core/model_result.hpp"
#include "bomcast/core/weekly_series.hpp"
#include "bomcast/forecasting/seasonal_adapter.hpp"
#include "bomcast/forecasting/tree_adapter.hpp"

#include <vector>

namespace bomcast::forecasting {

struct EnsembleConfig {
	double seasonal_weight = 0.4;
	double tree_weight = 0.6;
	/// Relative half-width of the band used when no model interval exists.
	double fallback_band = 0.2;

	/// @throws std::invalid_argument If weights are negative or do not sum to 1.
	void validate() const;
};

/**
 * @struct EnsembleForecast
 * @brief Published points plus the availability of each contributing model.
 */
struct EnsembleForecast {
	std::vector<core::ForecastPoint> points;
	bool seasonal_available = false;
	bool tree_available = false;

	/// Ensemble when both models contributed, otherwise the one that did.
	core::ForecastMethod method() const;
};

/**
 * @class EnsembleForecaster
 * @brief Runs the seasonal and tree adapters independently and blends them.
 *
 * Per step: both models give seasonal_weight * s + tree_weight * t with the
 * seasonal interval when one exists; a single model gives its own value; a
 * step neither model covers is omitted. Values are clamped at zero and
 * rounded to one decimal, so the output may be shorter than requested.
 */
class EnsembleForecaster {
public:
	EnsembleForecaster(SeasonalAdapter seasonal, TreeAdapter tree, EnsembleConfig config = {});

	EnsembleForecast forecast(const core::WeeklySeries &series, int steps) const;

	/**
	 * @brief Combines two model results into published points.
	 *
	 * Step i is dated @p last_week plus i + 1 weeks.
	 */
	static std::vector<core::ForecastPoint> blend(const core::ModelResult<core::Forecast> &seasonal,
	                                              const core::ModelResult<core::Forecast> &tree,
	                                              core::WeeklySeries::TimePoint last_week, int steps,
	                                              const EnsembleConfig &config);

	const SeasonalAdapter &seasonal() const {
		return seasonal_;
	}
	const TreeAdapter &tree() const {
		return tree_;
	}
	const EnsembleConfig &config() const {
		return config_;
	}

private:
	SeasonalAdapter seasonal_;
	TreeAdapter tree_;
	EnsembleConfig config_;
};

} // namespace bomcast::forecasting
