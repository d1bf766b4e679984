#include "bomcast/models/tree_forecaster.hpp"

#include "bomcast/core/model_result.hpp"
#include "bomcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace bomcast::models {

BoostingParams TreeConfig::boosting() const {
	BoostingParams params;
	params.n_estimators = n_estimators;
	params.max_depth = max_depth;
	params.learning_rate = learning_rate;
	params.subsample = subsample;
	params.colsample = colsample;
	params.reg_lambda = reg_lambda;
	params.seed = seed;
	return params;
}

void TreeConfig::validate() const {
	if (n_estimators < 1) {
		throw std::invalid_argument("Tree ensemble needs at least one estimator.");
	}
	if (max_depth < 1) {
		throw std::invalid_argument("Tree depth must be at least 1.");
	}
	if (learning_rate <= 0.0) {
		throw std::invalid_argument("Learning rate must be positive.");
	}
	if (subsample <= 0.0 || subsample > 1.0 || colsample <= 0.0 || colsample > 1.0) {
		throw std::invalid_argument("Subsample fractions must be in (0, 1].");
	}
	if (reg_lambda < 0.0) {
		throw std::invalid_argument("Leaf regularisation must be non-negative.");
	}
	if (min_training_rows == 0) {
		throw std::invalid_argument("Tree forecaster needs at least one training row.");
	}
}

TreeForecaster::TreeForecaster(TreeConfig config) : config_(config), regressor_(config.boosting()) {
	config_.validate();
}

Eigen::RowVectorXd TreeForecaster::toModelInput(const features::FeatureRow &row) {
	Eigen::RowVectorXd input(static_cast<Eigen::Index>(features::FeatureCount));
	for (std::size_t i = 0; i < features::FeatureCount; ++i) {
		const double value = row.values[i];
		input[static_cast<Eigen::Index>(i)] = features::isMissing(value) ? 0.0 : value;
	}
	return input;
}

void TreeForecaster::fit(const core::WeeklySeries &series) {
	is_fitted_ = false;
	if (series.empty()) {
		throw core::InsufficientHistoryError("Tree forecaster cannot fit an empty series.");
	}

	const auto frame = builder_.build(series);
	std::vector<const features::FeatureRow *> complete;
	for (const auto &row : frame.rows) {
		if (row.complete()) {
			complete.push_back(&row);
		}
	}
	if (complete.size() < config_.min_training_rows) {
		throw core::InsufficientHistoryError("Only " + std::to_string(complete.size()) +
		                                     " complete feature rows, need " +
		                                     std::to_string(config_.min_training_rows) + ".");
	}

	Eigen::MatrixXd X(static_cast<Eigen::Index>(complete.size()), static_cast<Eigen::Index>(features::FeatureCount));
	Eigen::VectorXd y(static_cast<Eigen::Index>(complete.size()));
	for (std::size_t r = 0; r < complete.size(); ++r) {
		const auto idx = static_cast<Eigen::Index>(r);
		for (std::size_t c = 0; c < features::FeatureCount; ++c) {
			X(idx, static_cast<Eigen::Index>(c)) = complete[r]->values[c];
		}
		y[idx] = complete[r]->target;
	}

	regressor_ = GradientBoostedRegressor(config_.boosting());
	regressor_.fit(X, y);

	history_ = series.getValues();
	last_week_ = series.lastWeek();
	last_row_ = frame.rows.back();
	training_rows_ = complete.size();
	is_fitted_ = true;

	BOMCAST_DEBUG("Tree model fitted on '{}' with {} of {} rows ({} trees).", series.label(), training_rows_,
	              frame.rows.size(), regressor_.treeCount());
}

features::FeatureRow TreeForecaster::carryForwardRow(std::size_t step, double previous) const {
	features::FeatureRow row = last_row_;
	features::FeatureBuilder::assignCalendar(row, core::calendar::addWeeks(last_week_, static_cast<int>(step) + 1),
	                                         history_.size() + step);
	row.values[features::Lag1] = previous;
	return row;
}

// The unknown value of the forecast week itself is taken as the latest known
// or predicted value, so rolling windows and the year-over-year delta stay
// defined.
features::FeatureRow TreeForecaster::recomputedRow(std::size_t step, const std::vector<double> &predictions) const {
	std::vector<double> extended = history_;
	extended.insert(extended.end(), predictions.begin(), predictions.end());
	extended.push_back(extended.back());
	return builder_.buildRow(extended, history_.size() + step,
	                         core::calendar::addWeeks(last_week_, static_cast<int>(step) + 1));
}

core::Forecast TreeForecaster::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	core::Forecast forecast;
	if (horizon <= 0) {
		return forecast;
	}

	std::vector<double> predictions;
	predictions.reserve(static_cast<std::size_t>(horizon));
	for (std::size_t step = 0; step < static_cast<std::size_t>(horizon); ++step) {
		const double previous = predictions.empty() ? history_.back() : predictions.back();
		const auto row = config_.mode == RecursiveMode::CarryForward ? carryForwardRow(step, previous)
		                                                             : recomputedRow(step, predictions);
		const double value = regressor_.predict(toModelInput(row));
		if (!std::isfinite(value)) {
			throw std::runtime_error("Tree forecast produced a non-finite value.");
		}
		predictions.push_back(std::max(0.0, value));
	}
	forecast.point = std::move(predictions);
	return forecast;
}

} // namespace bomcast::models
