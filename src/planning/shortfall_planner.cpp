#include "bomcast/planning/shortfall_planner.hpp"

#include <algorithm>

namespace bomcast::planning {

ShortfallPlanner::ShortfallPlanner(StockSnapshot stock) : stock_(std::move(stock)) {
}

double ShortfallPlanner::inStock(const std::string &code) const {
	auto it = stock_.find(code);
	return it == stock_.end() ? 0.0 : it->second;
}

ShortfallReport ShortfallPlanner::plan(const MaterialDemand &demand) const {
	ShortfallReport report;
	std::unordered_map<std::string, std::size_t> group_index;

	for (const auto &entry : demand.entries()) {
		const double stock = inStock(entry.code);
		const double gap = entry.required_qty - stock;
		const double to_order = std::max(0.0, gap);
		const double cost = std::max(0.0, entry.fabric.cost_per_unit);

		if (gap > 0.0) {
			ShortfallOrder order;
			order.code = entry.code;
			order.fabric = entry.fabric;
			order.required_qty = entry.required_qty;
			order.in_stock = stock;
			order.to_order = to_order;
			order.estimated_cost = to_order * cost;
			report.total_estimated_cost += order.estimated_cost;
			report.shortfalls.push_back(std::move(order));
		} else {
			++report.covered_by_stock;
		}

		auto it = group_index.find(entry.fabric.fabric_name);
		if (it == group_index.end()) {
			it = group_index.emplace(entry.fabric.fabric_name, report.groups.size()).first;
			FabricRequirementGroup group;
			group.fabric_name = entry.fabric.fabric_name;
			group.unit = entry.fabric.unit;
			report.groups.push_back(std::move(group));
		}
		auto &group = report.groups[it->second];
		group.total_required += entry.required_qty;

		ColourRequirement colour;
		colour.code = entry.code;
		colour.colour_name = entry.fabric.colour_name;
		colour.required_qty = entry.required_qty;
		colour.in_stock = stock;
		colour.gap = gap;
		colour.method = entry.dominantMethod();
		colour.cost_per_unit = cost;
		colour.order_cost = to_order * cost;
		group.colours.push_back(std::move(colour));
	}

	std::stable_sort(report.shortfalls.begin(), report.shortfalls.end(),
	                 [](const ShortfallOrder &a, const ShortfallOrder &b) { return a.required_qty > b.required_qty; });
	for (auto &group : report.groups) {
		std::stable_sort(group.colours.begin(), group.colours.end(),
		                 [](const ColourRequirement &a, const ColourRequirement &b) {
			                 return a.required_qty > b.required_qty;
		                 });
	}
	std::stable_sort(report.groups.begin(), report.groups.end(),
	                 [](const FabricRequirementGroup &a, const FabricRequirementGroup &b) {
		                 return a.total_required > b.total_required;
	                 });
	return report;
}

} // namespace bomcast::planning
