#include "bomcast/planning/planning_config.hpp"

#include <stdexcept>

namespace bomcast::planning {

const char *toString(ExplosionMode mode) {
	switch (mode) {
	case ExplosionMode::ProductAllocation:
		return "product-allocation";
	case ExplosionMode::FabricDirect:
		return "fabric-direct";
	}
	return "unknown";
}

forecasting::SelectionPolicy PlanningConfig::selectionPolicy() const {
	forecasting::SelectionPolicy policy;
	policy.horizon_weeks = horizon_weeks;
	policy.min_history_weeks = min_history_weeks_for_models;
	policy.min_active_weeks = min_active_weeks;
	policy.activity_window_weeks = activity_window_weeks;
	policy.average_window_weeks = average_window_weeks;
	return policy;
}

void PlanningConfig::validate() const {
	if (default_wastage_percent < 0.0) {
		throw std::invalid_argument("Default wastage must be non-negative.");
	}
	if (max_detailed_products == 0) {
		throw std::invalid_argument("At least one product must be reported in detail.");
	}
	if (ranking_window_weeks == 0) {
		throw std::invalid_argument("Ranking window must be positive.");
	}
	if (size_order.empty()) {
		throw std::invalid_argument("Size order must list at least one size.");
	}
	selectionPolicy().validate();
	product_seasonal.validate();
	fabric_seasonal.validate();
	tree.validate();
	ensemble.validate();
}

} // namespace bomcast::planning
