#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/core/model_result.hpp"
#include "bomcast/core/weekly_series.hpp"
#include "bomcast/models/tree_forecaster.hpp"

namespace bomcast::forecasting {

/**
 * @class TreeAdapter
 * @brief Wraps models::TreeForecaster behind the never-throwing result contract.
 *
 * The returned forecast has no interval.
 */
class TreeAdapter {
public:
	explicit TreeAdapter(models::TreeConfig config = {});

	core::ModelResult<core::Forecast> forecast(const core::WeeklySeries &series, int steps) const;

	const models::TreeConfig &config() const {
		return config_;
	}

private:
	models::TreeConfig config_;
};

} // namespace bomcast::forecasting
