#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/core/model_result.hpp"
#include "bomcast/core/weekly_series.hpp"

namespace bomcast::forecasting {

/**
 * @struct SeasonalSpec
 * @brief Order and fit settings of the seasonal ARIMA-family model.
 *
 * The product and overall series use a 52-week seasonal term; fabric colour
 * series omit it, since many short colour series make the seasonal fit slow
 * and often non-identifiable.
 */
struct SeasonalSpec {
	int p = 1;
	int d = 1;
	int q = 1;
	int P = 0;
	int D = 0;
	int Q = 0;
	int s = 0;
	int max_iterations = 200;
	double confidence = 0.8;

	/// SARIMA(1,1,1)(1,1,0)[52].
	static SeasonalSpec productDefault();
	/// ARIMA(1,1,1) without a seasonal term.
	static SeasonalSpec fabricDefault();

	bool isSeasonal() const {
		return s > 1 && (P > 0 || D > 0 || Q > 0);
	}

	/// @throws std::invalid_argument On negative orders, a missing period or a bad confidence level.
	void validate() const;
};

/**
 * @class SeasonalAdapter
 * @brief Fits a fresh seasonal model per call and reports failures as values.
 *
 * A single fit attempt is made, capped at SeasonalSpec::max_iterations. Any fit or
 * forecast failure comes back as an unavailable result; forecast() never
 * throws.
 */
class SeasonalAdapter {
public:
	explicit SeasonalAdapter(SeasonalSpec spec = SeasonalSpec::productDefault());

	core::ModelResult<core::Forecast> forecast(const core::WeeklySeries &series, int steps) const;

	const SeasonalSpec &spec() const {
		return spec_;
	}

private:
	SeasonalSpec spec_;
};

} // namespace bomcast::forecasting
