#include "bomcast/forecasting/ensemble_forecaster.hpp"

#include "bomcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace bomcast::forecasting {

namespace {

constexpr double kWeightTolerance = 1e-9;

const core::Forecast *usable(const core::ModelResult<core::Forecast> &result) {
	return result.isAvailable() ? &result.value() : nullptr;
}

double publish(double value) {
	return core::roundToTenth(std::max(0.0, value));
}

} // namespace

void EnsembleConfig::validate() const {
	if (seasonal_weight < 0.0 || tree_weight < 0.0) {
		throw std::invalid_argument("Ensemble weights must be non-negative.");
	}
	if (std::abs(seasonal_weight + tree_weight - 1.0) > kWeightTolerance) {
		throw std::invalid_argument("Ensemble weights must sum to 1.");
	}
	if (fallback_band < 0.0 || fallback_band >= 1.0) {
		throw std::invalid_argument("Fallback band must be in [0, 1).");
	}
}

core::ForecastMethod EnsembleForecast::method() const {
	if (seasonal_available && tree_available) {
		return core::ForecastMethod::Ensemble;
	}
	if (seasonal_available) {
		return core::ForecastMethod::Seasonal;
	}
	if (tree_available) {
		return core::ForecastMethod::Tree;
	}
	return core::ForecastMethod::AverageFallback;
}

EnsembleForecaster::EnsembleForecaster(SeasonalAdapter seasonal, TreeAdapter tree, EnsembleConfig config)
    : seasonal_(std::move(seasonal)), tree_(std::move(tree)), config_(config) {
	config_.validate();
}

std::vector<core::ForecastPoint> EnsembleForecaster::blend(const core::ModelResult<core::Forecast> &seasonal,
                                                           const core::ModelResult<core::Forecast> &tree,
                                                           core::WeeklySeries::TimePoint last_week, int steps,
                                                           const EnsembleConfig &config) {
	const core::Forecast *s = usable(seasonal);
	const core::Forecast *t = usable(tree);

	std::vector<core::ForecastPoint> points;
	for (int i = 0; i < steps; ++i) {
		const auto step = static_cast<std::size_t>(i);
		const bool has_s = s && step < s->horizon();
		const bool has_t = t && step < t->horizon();
		if (!has_s && !has_t) {
			continue;
		}

		double value = 0.0;
		if (has_s && has_t) {
			value = config.seasonal_weight * s->point[step] + config.tree_weight * t->point[step];
		} else {
			value = has_s ? s->point[step] : t->point[step];
		}

		double low = 0.0;
		double high = 0.0;
		if (has_s && s->hasInterval()) {
			low = (*s->lower)[step];
			high = (*s->upper)[step];
		} else {
			low = value * (1.0 - config.fallback_band);
			high = value * (1.0 + config.fallback_band);
		}

		core::ForecastPoint point;
		point.week = core::calendar::addWeeks(last_week, i + 1);
		point.forecast = publish(value);
		// A blended value can leave the seasonal band; widen it to keep low <= forecast <= high.
		point.low = std::min(publish(low), point.forecast);
		point.high = std::max(publish(high), point.forecast);
		points.push_back(point);
	}
	return points;
}

EnsembleForecast EnsembleForecaster::forecast(const core::WeeklySeries &series, int steps) const {
	EnsembleForecast result;
	if (series.empty() || steps <= 0) {
		return result;
	}

	const auto seasonal = seasonal_.forecast(series, steps);
	const auto tree = tree_.forecast(series, steps);
	result.seasonal_available = seasonal.isAvailable();
	result.tree_available = tree.isAvailable();
	result.points = blend(seasonal, tree, series.lastWeek(), steps, config_);

	BOMCAST_DEBUG("Ensemble for '{}': seasonal {}, tree {}, {} of {} steps.", series.label(),
	              result.seasonal_available ? "ok" : toString(seasonal.reason()),
	              result.tree_available ? "ok" : toString(tree.reason()), result.points.size(), steps);
	return result;
}

} // namespace bomcast::forecasting
