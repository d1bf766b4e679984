#pragma once

#include "bomcast/forecasting/ensemble_forecaster.hpp"
#include "bomcast/forecasting/method_selector.hpp"
#include "bomcast/forecasting/seasonal_adapter.hpp"
#include "bomcast/models/tree_forecaster.hpp"

#include <string>
#include <vector>

namespace bomcast::planning {

/// Which entity is forecast to derive fabric requirements.
enum class ExplosionMode {
	ProductAllocation,
	FabricDirect
};

const char *toString(ExplosionMode mode);

/**
 * @struct PlanningConfig
 * @brief Every tunable of a planning run, with the production defaults.
 */
struct PlanningConfig {
	int horizon_weeks = 8;
	double default_wastage_percent = 5.0;

	// Method selection
	std::size_t min_history_weeks_for_models = 30;
	std::size_t min_active_weeks = 4;
	std::size_t activity_window_weeks = 8;
	std::size_t average_window_weeks = 8;

	// Reporting
	bool trim_partial_edge_weeks = true;
	std::size_t max_detailed_products = 10;
	std::size_t product_history_weeks = 26;
	std::size_t overall_history_weeks = 52;
	std::size_t ranking_window_weeks = 52;
	std::size_t max_drivers_per_colour = 5;
	std::vector<std::string> size_order = {"XS", "S", "M", "L", "XL", "2XL", "3XL"};

	ExplosionMode mode = ExplosionMode::ProductAllocation;

	forecasting::SeasonalSpec product_seasonal = forecasting::SeasonalSpec::productDefault();
	forecasting::SeasonalSpec fabric_seasonal = forecasting::SeasonalSpec::fabricDefault();
	models::TreeConfig tree;
	forecasting::EnsembleConfig ensemble;

	/// @throws std::invalid_argument Naming the first invalid setting.
	void validate() const;

	forecasting::SelectionPolicy selectionPolicy() const;
};

} // namespace bomcast::planning
