#pragma once

#include "bomcast/core/weekly_series.hpp"
#include "bomcast/data/data_source.hpp"
#include "bomcast/forecasting/method_selector.hpp"
#include "bomcast/planning/plan_result.hpp"
#include "bomcast/planning/planning_config.hpp"

#include <map>
#include <string>
#include <vector>

namespace bomcast::planning {

/**
 * @class DemandPlanner
 * @brief Runs the full forecast-to-purchase pipeline for one data snapshot.
 *
 * The as-of week is the last week of the (edge-trimmed) order history. Every
 * product, and in fabric-direct mode every fabric colour, is forecast
 * independently through the method-selection policy; the resulting demand is
 * exploded into fabric colours and reconciled against stock.
 */
class DemandPlanner {
public:
	explicit DemandPlanner(PlanningConfig config = {});

	/// Loads from @p source and plans. UpstreamDataError is logged and rethrown.
	PlanResult run(data::IDataSource &source) const;

	/// @throws data::UpstreamDataError If the order history is empty, or fabric
	///         consumption is missing in fabric-direct mode.
	PlanResult plan(const data::PlanningInputs &inputs) const;

	/// Sorts by week and drops the first and last (partial) weeks when requested.
	static std::vector<data::WeeklyTotalRow> prepareTotals(std::vector<data::WeeklyTotalRow> rows, bool trim_edges);

	static OverallStats overallStats(const std::vector<data::WeeklyTotalRow> &rows);

	const PlanningConfig &config() const {
		return config_;
	}

private:
	// Forward-filled series for the models, zero-filled for activity and ranking.
	struct EntitySeries {
		core::WeeklySeries modelled;
		core::WeeklySeries activity;
	};
	using SeriesMap = std::map<std::string, EntitySeries>;

	static const PlanningConfig &validated(const PlanningConfig &config);
	static EntitySeries entitySeries(std::vector<core::WeeklySeries::Observation> observations,
	                                 const std::string &label);
	template <typename Row, typename KeyFn, typename ValueFn>
	static SeriesMap seriesBy(const std::vector<Row> &rows, KeyFn key, ValueFn value);

	void forecastOverall(const std::vector<data::WeeklyTotalRow> &totals, PlanResult &result) const;
	std::vector<forecasting::SeriesForecast> forecastProducts(const data::PlanningInputs &inputs,
	                                                          const SeriesMap &product_series,
	                                                          PlanResult &result) const;
	void explodeProducts(const data::PlanningInputs &inputs, const std::vector<forecasting::SeriesForecast> &products,
	                     RequirementsExplosion &explosion, MaterialDemand &demand, PlanResult &result) const;
	void explodeFabrics(const data::PlanningInputs &inputs, const BomTable &bom, RequirementsExplosion &explosion,
	                    MaterialDemand &demand, PlanResult &result) const;
	void attachDrivers(const data::PlanningInputs &inputs, std::vector<FabricRequirementGroup> &groups) const;

	std::vector<BreakdownEntry> sizeBreakdown(const BomProportion &sizes, double total) const;
	static std::vector<BreakdownEntry> colourBreakdown(const BomProportion &variations, double total);

	PlanningConfig config_;
	forecasting::MethodSelector product_selector_;
	forecasting::MethodSelector fabric_selector_;
};

} // namespace bomcast::planning
