#pragma once

#include "bomcast/features/feature_builder.hpp"
#include "bomcast/models/gradient_boosting.hpp"
#include "bomcast/models/iforecaster.hpp"

#include <cstddef>
#include <vector>

namespace bomcast::models {

/// How the feature row for a future week is synthesised.
enum class RecursiveMode {
	/**
	 * Copy the last observed row, advance its calendar fields and replace
	 * only lag_1 with the previous prediction. Other lag and rolling features
	 * stay frozen at their last observed values, which understates feature
	 * drift on long horizons.
	 */
	CarryForward,
	/// Rebuild every feature from the observed history extended with predictions.
	Recompute
};

struct TreeConfig {
	int n_estimators = 200;
	int max_depth = 4;
	double learning_rate = 0.05;
	double subsample = 0.8;
	double colsample = 0.8;
	double reg_lambda = 1.0;
	std::uint32_t seed = 42;
	std::size_t min_training_rows = 20;
	RecursiveMode mode = RecursiveMode::CarryForward;

	BoostingParams boosting() const;

	/// @throws std::invalid_argument On out-of-range hyper-parameters.
	void validate() const;
};

/**
 * @class TreeForecaster
 * @brief Recursive multi-step forecaster over engineered weekly features.
 *
 * Training uses only feature rows with no missing value. Missing features are
 * replaced by zero just before prediction, and predictions are floored at 0.
 */
class TreeForecaster final : public IForecaster {
public:
	explicit TreeForecaster(TreeConfig config = {});

	/// @throws core::InsufficientHistoryError With fewer complete rows than required.
	void fit(const core::WeeklySeries &series) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "GradientBoostedTrees";
	}

	std::size_t trainingRows() const {
		return training_rows_;
	}
	const GradientBoostedRegressor &regressor() const {
		return regressor_;
	}
	const TreeConfig &config() const {
		return config_;
	}

private:
	static Eigen::RowVectorXd toModelInput(const features::FeatureRow &row);

	features::FeatureRow carryForwardRow(std::size_t step, double previous) const;
	features::FeatureRow recomputedRow(std::size_t step, const std::vector<double> &predictions) const;

	TreeConfig config_;
	features::FeatureBuilder builder_;
	GradientBoostedRegressor regressor_;
	std::vector<double> history_;
	core::WeeklySeries::TimePoint last_week_{};
	features::FeatureRow last_row_;
	std::size_t training_rows_ = 0;
	bool is_fitted_ = false;
};

} // namespace bomcast::models
