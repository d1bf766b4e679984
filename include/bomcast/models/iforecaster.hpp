#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/core/weekly_series.hpp"

#include <string>

namespace bomcast::models {

/**
 * @class IForecaster
 * @brief Common fit/predict contract of the raw weekly models.
 *
 * Implementations throw on failure (core::InsufficientHistoryError,
 * core::ConvergenceError, std::runtime_error); the forecasting adapters turn
 * those into core::ModelResult values.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to a weekly series.
	 */
	virtual void fit(const core::WeeklySeries &series) = 0;

	/**
	 * @brief Forecasts the @p horizon weeks following the fitted series.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	virtual std::string getName() const = 0;
};

} // namespace bomcast::models
