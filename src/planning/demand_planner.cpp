#include "bomcast/planning/demand_planner.hpp"

#include "bomcast/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace bomcast::planning {

namespace {

constexpr std::size_t kComparisonWindow = 12;
constexpr std::size_t kYoyWindowStart = 56;
constexpr std::size_t kYoyWindowEnd = 48;

forecasting::MethodSelector makeSelector(const PlanningConfig &config, const forecasting::SeasonalSpec &seasonal) {
	return forecasting::MethodSelector(
	    config.selectionPolicy(),
	    forecasting::EnsembleForecaster(forecasting::SeasonalAdapter(seasonal), forecasting::TreeAdapter(config.tree),
	                                    config.ensemble));
}

double rowAov(const data::WeeklyTotalRow &row) {
	if (row.average_order_value) {
		return *row.average_order_value;
	}
	return row.order_count > 0.0 ? row.revenue / row.order_count : 0.0;
}

template <typename Fn>
double meanOver(const std::vector<data::WeeklyTotalRow> &rows, std::size_t begin, std::size_t end, Fn value) {
	if (begin >= end) {
		return 0.0;
	}
	double sum = 0.0;
	for (std::size_t i = begin; i < end; ++i) {
		sum += value(rows[i]);
	}
	return sum / static_cast<double>(end - begin);
}

std::map<std::string, BomProportion> proportionsByProduct(const std::vector<data::MixRow> &rows) {
	std::map<std::string, std::vector<BomProportion::Observation>> grouped;
	for (const auto &row : rows) {
		grouped[row.product].push_back(BomProportion::Observation{row.key, row.label, row.units});
	}
	std::map<std::string, BomProportion> result;
	for (const auto &entry : grouped) {
		result.emplace(entry.first, BomProportion::fromUnits(entry.second));
	}
	return result;
}

template <typename Row, typename KeyFn, typename ValueFn>
std::map<std::string, std::vector<core::WeeklySeries::Observation>> groupBy(const std::vector<Row> &rows, KeyFn key,
                                                                           ValueFn value) {
	std::map<std::string, std::vector<core::WeeklySeries::Observation>> grouped;
	for (const auto &row : rows) {
		grouped[key(row)].push_back(core::WeeklySeries::Observation{row.week, value(row)});
	}
	return grouped;
}

} // namespace

DemandPlanner::DemandPlanner(PlanningConfig config)
    : config_(validated(config)), product_selector_(makeSelector(config_, config_.product_seasonal)),
      fabric_selector_(makeSelector(config_, config_.fabric_seasonal)) {
}

const PlanningConfig &DemandPlanner::validated(const PlanningConfig &config) {
	config.validate();
	return config;
}

DemandPlanner::EntitySeries DemandPlanner::entitySeries(std::vector<core::WeeklySeries::Observation> observations,
                                                        const std::string &label) {
	auto activity = core::WeeklySeries::fromObservations(observations, core::WeeklySeries::GapFill::Zero, label);
	auto modelled =
	    core::WeeklySeries::fromObservations(std::move(observations), core::WeeklySeries::GapFill::ForwardFill, label);
	return EntitySeries{std::move(modelled), std::move(activity)};
}

template <typename Row, typename KeyFn, typename ValueFn>
DemandPlanner::SeriesMap DemandPlanner::seriesBy(const std::vector<Row> &rows, KeyFn key, ValueFn value) {
	SeriesMap result;
	for (auto &entry : groupBy(rows, key, value)) {
		result.emplace(entry.first, entitySeries(std::move(entry.second), entry.first));
	}
	return result;
}

PlanResult DemandPlanner::run(data::IDataSource &source) const {
	BOMCAST_INFO("Loading planning inputs from {}.", source.describe());
	try {
		return plan(source.load());
	} catch (const data::UpstreamDataError &e) {
		BOMCAST_ERROR("Planning aborted: {}", e.what());
		throw;
	}
}

std::vector<data::WeeklyTotalRow> DemandPlanner::prepareTotals(std::vector<data::WeeklyTotalRow> rows,
                                                               bool trim_edges) {
	for (auto &row : rows) {
		row.week = core::calendar::weekStart(row.week);
	}
	std::stable_sort(rows.begin(), rows.end(),
	                 [](const data::WeeklyTotalRow &a, const data::WeeklyTotalRow &b) { return a.week < b.week; });
	if (trim_edges && rows.size() > 2) {
		rows.erase(rows.begin());
		rows.pop_back();
	}
	return rows;
}

OverallStats DemandPlanner::overallStats(const std::vector<data::WeeklyTotalRow> &rows) {
	OverallStats stats;
	if (rows.empty()) {
		return stats;
	}
	const std::size_t n = rows.size();
	auto orders = [](const data::WeeklyTotalRow &row) { return row.order_count; };

	stats.weeks_of_data = n;
	stats.first_week = rows.front().week;
	stats.last_week = rows.back().week;
	stats.total_orders = meanOver(rows, 0, n, orders) * static_cast<double>(n);

	const std::size_t recent_begin = n > kComparisonWindow ? n - kComparisonWindow : 0;
	const std::size_t previous_begin = n > 2 * kComparisonWindow ? n - 2 * kComparisonWindow : 0;
	stats.recent_avg_orders = meanOver(rows, recent_begin, n, orders);
	stats.previous_avg_orders = meanOver(rows, previous_begin, recent_begin, orders);
	stats.recent_aov = meanOver(rows, recent_begin, n, rowAov);
	stats.previous_aov = meanOver(rows, previous_begin, recent_begin, rowAov);

	if (n > kYoyWindowStart) {
		stats.yoy_same_period_avg = meanOver(rows, n - kYoyWindowStart, n - kYoyWindowEnd, orders);
	}

	std::array<double, 12> month_sum{};
	std::array<std::size_t, 12> month_count{};
	for (const auto &row : rows) {
		const auto m = static_cast<std::size_t>(core::calendar::month(row.week) - 1);
		month_sum[m] += row.order_count;
		++month_count[m];
	}
	double mean_of_means = 0.0;
	std::size_t months_present = 0;
	for (std::size_t m = 0; m < 12; ++m) {
		if (month_count[m] > 0) {
			mean_of_means += month_sum[m] / static_cast<double>(month_count[m]);
			++months_present;
		}
	}
	if (months_present > 0) {
		mean_of_means /= static_cast<double>(months_present);
	}
	for (std::size_t m = 0; m < 12; ++m) {
		if (month_count[m] > 0 && mean_of_means > 0.0) {
			stats.monthly_index[m] = month_sum[m] / static_cast<double>(month_count[m]) / mean_of_means * 100.0;
		}
	}
	return stats;
}

void DemandPlanner::forecastOverall(const std::vector<data::WeeklyTotalRow> &totals, PlanResult &result) const {
	result.overall = overallStats(totals);

	const std::size_t history_begin =
	    totals.size() > config_.overall_history_weeks ? totals.size() - config_.overall_history_weeks : 0;
	for (std::size_t i = history_begin; i < totals.size(); ++i) {
		result.weekly_history.push_back(
		    WeeklyTotalPoint{totals[i].week, totals[i].order_count, totals[i].revenue, rowAov(totals[i])});
	}

	std::vector<core::WeeklySeries::Observation> observations;
	observations.reserve(totals.size());
	for (const auto &row : totals) {
		observations.push_back(core::WeeklySeries::Observation{row.week, row.order_count});
	}
	const auto orders = entitySeries(std::move(observations), "orders");
	result.overall_forecast = product_selector_.forecast(orders.modelled, orders.activity, result.as_of);
	if (!result.overall_forecast) {
		BOMCAST_WARN("Overall order forecast skipped: too little recent activity.");
		return;
	}

	const double aov = result.overall.recent_aov;
	for (const auto &point : result.overall_forecast->points) {
		core::ForecastPoint revenue = point;
		revenue.forecast = core::roundTo(point.forecast * aov, 0);
		revenue.low = core::roundTo(point.low * aov, 0);
		revenue.high = core::roundTo(point.high * aov, 0);
		result.revenue_forecast.push_back(revenue);
	}
	BOMCAST_INFO("Overall orders forecast by {}: {:.1f} over {} weeks.",
	             core::toString(result.overall_forecast->method), result.overall_forecast->total,
	             config_.horizon_weeks);
}

std::vector<BreakdownEntry> DemandPlanner::sizeBreakdown(const BomProportion &sizes, double total) const {
	std::vector<BreakdownEntry> breakdown;
	std::unordered_set<std::string> listed;
	auto append = [&](const BomProportion::Entry &entry) {
		breakdown.push_back(BreakdownEntry{entry.key, entry.label, core::roundTo(entry.share * 100.0, 1),
		                                   core::roundTo(total * entry.share, 0)});
		listed.insert(entry.key);
	};
	for (const auto &size : config_.size_order) {
		for (const auto &entry : sizes.entries()) {
			if (entry.key == size) {
				append(entry);
			}
		}
	}
	for (const auto &entry : sizes.entries()) {
		if (!listed.count(entry.key)) {
			append(entry);
		}
	}
	return breakdown;
}

std::vector<BreakdownEntry> DemandPlanner::colourBreakdown(const BomProportion &variations, double total) {
	std::vector<BreakdownEntry> breakdown;
	for (const auto &entry : variations.entries()) {
		breakdown.push_back(BreakdownEntry{entry.key, entry.label, core::roundTo(entry.share * 100.0, 1),
		                                   core::roundTo(total * entry.share, 0)});
	}
	std::stable_sort(breakdown.begin(), breakdown.end(),
	                 [](const BreakdownEntry &a, const BreakdownEntry &b) { return a.percent > b.percent; });
	return breakdown;
}

std::vector<forecasting::SeriesForecast> DemandPlanner::forecastProducts(const data::PlanningInputs &inputs,
                                                                         const SeriesMap &product_series,
                                                                         PlanResult &result) const {
	const auto ranking_start =
	    core::calendar::addWeeks(result.as_of, -static_cast<int>(config_.ranking_window_weeks) + 1);
	std::vector<std::pair<std::string, double>> ranking;
	for (const auto &entry : product_series) {
		const auto &series = entry.second.activity;
		double units = 0.0;
		for (std::size_t i = 0; i < series.size(); ++i) {
			const auto week = series.getTimestamps()[i];
			if (week >= ranking_start && week <= result.as_of) {
				units += series.getValues()[i];
			}
		}
		ranking.emplace_back(entry.first, units);
	}
	std::stable_sort(ranking.begin(), ranking.end(),
	                 [](const auto &a, const auto &b) { return a.second > b.second; });

	const auto sizes = proportionsByProduct(inputs.size_mix);
	const auto variations = proportionsByProduct(inputs.variation_mix);

	std::vector<forecasting::SeriesForecast> forecasts;
	for (const auto &ranked : ranking) {
		const auto &series = product_series.at(ranked.first);
		auto forecast = product_selector_.forecast(series.modelled, series.activity, result.as_of);
		if (!forecast) {
			continue;
		}
		forecasts.push_back(*forecast);

		if (result.products.size() >= config_.max_detailed_products) {
			continue;
		}
		ProductForecast product;
		product.name = ranked.first;
		product.ranking_units = ranked.second;
		product.forecast = *forecast;
		auto size_it = sizes.find(ranked.first);
		if (size_it != sizes.end()) {
			product.size_breakdown = sizeBreakdown(size_it->second, forecast->total);
		}
		auto variation_it = variations.find(ranked.first);
		if (variation_it != variations.end()) {
			product.colour_breakdown = colourBreakdown(variation_it->second, forecast->total);
		}
		const auto history = series.modelled.extendedTo(result.as_of);
		const auto end = history.indexOf(result.as_of).value_or(history.size() - 1) + 1;
		const auto begin = end > config_.product_history_weeks ? end - config_.product_history_weeks : 0;
		for (std::size_t i = begin; i < end; ++i) {
			product.history.emplace_back(history.getTimestamps()[i], history.getValues()[i]);
		}
		result.products.push_back(std::move(product));
	}
	BOMCAST_INFO("Forecast {} of {} products; {} reported in detail.", forecasts.size(), ranking.size(),
	             result.products.size());
	return forecasts;
}

void DemandPlanner::explodeProducts(const data::PlanningInputs &inputs,
                                    const std::vector<forecasting::SeriesForecast> &products,
                                    RequirementsExplosion &explosion, MaterialDemand &demand,
                                    PlanResult &result) const {
	const auto sizes = proportionsByProduct(inputs.size_mix);
	const auto variations = proportionsByProduct(inputs.variation_mix);
	const BomProportion none;

	for (const auto &product : products) {
		auto size_it = sizes.find(product.name);
		auto variation_it = variations.find(product.name);
		explosion.allocate(ProductDemand{product.name, product.total, product.method},
		                   variation_it == variations.end() ? none : variation_it->second,
		                   size_it == sizes.end() ? none : size_it->second, demand);
		++result.summary.method_counts[product.method];
	}
}

void DemandPlanner::explodeFabrics(const data::PlanningInputs &inputs, const BomTable &bom,
                                   RequirementsExplosion &explosion, MaterialDemand &demand,
                                   PlanResult &result) const {
	std::unordered_map<std::string, FabricInfo> stock_info;
	for (const auto &row : inputs.fabric_stock) {
		stock_info.emplace(row.fabric_colour_code, row.fabric);
	}

	const auto fabric_series = seriesBy(
	    inputs.fabric_consumption, [](const data::FabricConsumptionRow &row) { return row.fabric_colour_code; },
	    [](const data::FabricConsumptionRow &row) { return row.quantity; });

	for (const auto &entry : fabric_series) {
		auto forecast = fabric_selector_.forecast(entry.second.modelled, entry.second.activity, result.as_of);
		if (!forecast) {
			continue;
		}
		FabricDemand fabric;
		fabric.code = entry.first;
		fabric.quantity = forecast->total;
		fabric.method = forecast->method;
		if (auto info = bom.fabricInfo(entry.first)) {
			fabric.fabric = *info;
		} else if (auto it = stock_info.find(entry.first); it != stock_info.end()) {
			fabric.fabric = it->second;
		} else {
			fabric.fabric.fabric_name = "Unassigned";
			fabric.fabric.colour_name = entry.first;
		}
		explosion.addDirect(fabric, demand);
		++result.summary.method_counts[fabric.method];
	}
	BOMCAST_INFO("Forecast {} of {} fabric colours directly.", explosion.stats().direct_entries,
	             fabric_series.size());
}

void DemandPlanner::attachDrivers(const data::PlanningInputs &inputs,
                                  std::vector<FabricRequirementGroup> &groups) const {
	std::unordered_map<std::string, std::vector<DriverShare>> by_code;
	std::unordered_map<std::string, double> totals;
	for (const auto &row : inputs.product_fabric_consumption) {
		auto &drivers = by_code[row.fabric_colour_code];
		auto it = std::find_if(drivers.begin(), drivers.end(),
		                       [&](const DriverShare &d) { return d.product == row.product; });
		if (it == drivers.end()) {
			drivers.push_back(DriverShare{row.product, row.quantity, 0.0});
		} else {
			it->quantity += row.quantity;
		}
		totals[row.fabric_colour_code] += row.quantity;
	}

	for (auto &group : groups) {
		for (auto &colour : group.colours) {
			auto it = by_code.find(colour.code);
			if (it == by_code.end()) {
				continue;
			}
			auto drivers = it->second;
			const double total = totals[colour.code];
			for (auto &driver : drivers) {
				driver.share = total > 0.0 ? driver.quantity / total : 0.0;
			}
			std::stable_sort(drivers.begin(), drivers.end(),
			                 [](const DriverShare &a, const DriverShare &b) { return a.quantity > b.quantity; });
			if (drivers.size() > config_.max_drivers_per_colour) {
				drivers.resize(config_.max_drivers_per_colour);
			}
			colour.drivers = std::move(drivers);
		}
	}
}

PlanResult DemandPlanner::plan(const data::PlanningInputs &inputs) const {
	if (inputs.weekly_totals.empty()) {
		throw data::UpstreamDataError("No weekly order totals were supplied.");
	}
	if (config_.mode == ExplosionMode::FabricDirect && inputs.fabric_consumption.empty()) {
		throw data::UpstreamDataError("Fabric-direct planning needs weekly fabric consumption.");
	}

	PlanResult result;
	result.generated_at = std::chrono::system_clock::now();
	result.horizon_weeks = config_.horizon_weeks;
	result.wastage_percent = config_.default_wastage_percent;
	result.mode = config_.mode;

	const auto totals = prepareTotals(inputs.weekly_totals, config_.trim_partial_edge_weeks);
	result.as_of = totals.back().week;
	BOMCAST_INFO("Planning {} weeks ahead of {} in {} mode.", config_.horizon_weeks,
	             core::calendar::formatIsoDate(result.as_of), toString(config_.mode));

	forecastOverall(totals, result);

	const auto product_series = seriesBy(
	    inputs.product_units, [](const data::ProductUnitsRow &row) { return row.product; },
	    [](const data::ProductUnitsRow &row) { return row.units; });
	const auto products = forecastProducts(inputs, product_series, result);

	const BomTable bom(inputs.bom_lines);
	RequirementsExplosion explosion(bom, config_.default_wastage_percent);
	MaterialDemand demand;
	if (config_.mode == ExplosionMode::ProductAllocation) {
		explodeProducts(inputs, products, explosion, demand, result);
	} else {
		explodeFabrics(inputs, bom, explosion, demand, result);
	}
	demand.freeze();
	result.explosion = explosion.stats();
	if (result.explosion.missing_paths > 0) {
		BOMCAST_DEBUG("{} size/variation paths had no BOM lines.", result.explosion.missing_paths);
	}

	StockSnapshot stock;
	for (const auto &row : inputs.fabric_stock) {
		stock[row.fabric_colour_code] += row.balance.value_or(0.0);
	}
	auto report = ShortfallPlanner(std::move(stock)).plan(demand);
	if (config_.mode == ExplosionMode::FabricDirect) {
		attachDrivers(inputs, report.groups);
	}

	result.fabric_requirements = std::move(report.groups);
	result.shortfalls = std::move(report.shortfalls);

	auto &summary = result.summary;
	for (const auto &product : result.products) {
		summary.total_forecast_units += product.forecast.total;
	}
	summary.products_forecasted = result.products.size();
	summary.fabric_types = result.fabric_requirements.size();
	summary.fabric_colours = demand.size();
	summary.shortfall_count = result.shortfalls.size();
	summary.covered_by_stock = report.covered_by_stock;
	summary.estimated_purchase_cost = report.total_estimated_cost;

	BOMCAST_INFO("{} fabric colours required, {} short, {} covered by stock.", summary.fabric_colours,
	             summary.shortfall_count, summary.covered_by_stock);
	return result;
}

} // namespace bomcast::planning
