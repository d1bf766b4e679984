#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/planning/material_demand.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace bomcast::planning {

/// Current balance per fabric colour code.
using StockSnapshot = std::unordered_map<std::string, double>;

struct ShortfallOrder {
	std::string code;
	FabricInfo fabric;
	double required_qty = 0.0;
	double in_stock = 0.0;
	double to_order = 0.0;
	double estimated_cost = 0.0;
};

/// A product's contribution to a fabric colour's recent consumption.
struct DriverShare {
	std::string product;
	double quantity = 0.0;
	double share = 0.0;
};

struct ColourRequirement {
	std::string code;
	std::string colour_name;
	double required_qty = 0.0;
	double in_stock = 0.0;
	/// required - in_stock; negative when stock covers the requirement.
	double gap = 0.0;
	core::ForecastMethod method = core::ForecastMethod::AverageFallback;
	double cost_per_unit = 0.0;
	double order_cost = 0.0;
	std::vector<DriverShare> drivers;
};

struct FabricRequirementGroup {
	std::string fabric_name;
	std::string unit;
	double total_required = 0.0;
	std::vector<ColourRequirement> colours;
};

struct ShortfallReport {
	/// Descending by required quantity; ties keep demand order.
	std::vector<ShortfallOrder> shortfalls;
	/// Descending by total requirement.
	std::vector<FabricRequirementGroup> groups;
	std::size_t covered_by_stock = 0;
	double total_estimated_cost = 0.0;
};

/**
 * @class ShortfallPlanner
 * @brief Reconciles fabric requirements against stock.
 *
 * A colour absent from the snapshot has zero stock. Only positive gaps become
 * orders; a colour whose stock meets its requirement counts as covered.
 */
class ShortfallPlanner {
public:
	explicit ShortfallPlanner(StockSnapshot stock);

	ShortfallReport plan(const MaterialDemand &demand) const;

	double inStock(const std::string &code) const;

private:
	StockSnapshot stock_;
};

} // namespace bomcast::planning
