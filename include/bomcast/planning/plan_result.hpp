#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/forecasting/method_selector.hpp"
#include "bomcast/planning/planning_config.hpp"
#include "bomcast/planning/requirements_explosion.hpp"
#include "bomcast/planning/shortfall_planner.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bomcast::planning {

/**
 * @struct OverallStats
 * @brief Order-level statistics over the (edge-trimmed) weekly totals.
 *
 * Recent and previous windows are the last 12 rows and the 12 rows before
 * them. monthly_index[m] is the mean weekly orders of month m + 1 relative to
 * the mean of all monthly means, times 100; 0 for months without data.
 */
struct OverallStats {
	double total_orders = 0.0;
	std::size_t weeks_of_data = 0;
	core::calendar::TimePoint first_week;
	core::calendar::TimePoint last_week;
	double recent_avg_orders = 0.0;
	double previous_avg_orders = 0.0;
	double recent_aov = 0.0;
	double previous_aov = 0.0;
	/// Mean orders of rows -56..-48, when more than 56 weeks exist.
	std::optional<double> yoy_same_period_avg;
	std::array<double, 12> monthly_index{};
};

struct WeeklyTotalPoint {
	core::calendar::TimePoint week;
	double orders = 0.0;
	double revenue = 0.0;
	double aov = 0.0;
};

struct BreakdownEntry {
	std::string key;
	std::string label;
	double percent = 0.0;
	double units = 0.0;
};

struct ProductForecast {
	std::string name;
	double ranking_units = 0.0;
	forecasting::SeriesForecast forecast;
	std::vector<BreakdownEntry> size_breakdown;
	std::vector<BreakdownEntry> colour_breakdown;
	std::vector<std::pair<core::calendar::TimePoint, double>> history;
};

struct PlanSummary {
	double total_forecast_units = 0.0;
	std::size_t products_forecasted = 0;
	std::size_t fabric_types = 0;
	std::size_t fabric_colours = 0;
	std::size_t shortfall_count = 0;
	std::size_t covered_by_stock = 0;
	double estimated_purchase_cost = 0.0;
	/// Forecast entities (products or fabric colours) per method.
	std::map<core::ForecastMethod, std::size_t> method_counts;
};

/**
 * @struct PlanResult
 * @brief Complete output of one planning run.
 */
struct PlanResult {
	core::calendar::TimePoint generated_at;
	core::calendar::TimePoint as_of;
	int horizon_weeks = 0;
	double wastage_percent = 0.0;
	ExplosionMode mode = ExplosionMode::ProductAllocation;

	OverallStats overall;
	std::vector<WeeklyTotalPoint> weekly_history;
	std::optional<forecasting::SeriesForecast> overall_forecast;
	std::vector<core::ForecastPoint> revenue_forecast;

	std::vector<ProductForecast> products;
	std::vector<FabricRequirementGroup> fabric_requirements;
	std::vector<ShortfallOrder> shortfalls;
	PlanSummary summary;
	ExplosionStats explosion;
};

} // namespace bomcast::planning
