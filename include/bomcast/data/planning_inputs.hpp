#pragma once

#include "bomcast/core/calendar.hpp"
#include "bomcast/planning/bom.hpp"

#include <optional>
#include <string>
#include <vector>

namespace bomcast::data {

using core::calendar::TimePoint;

/// Order totals of one calendar week with at least one order.
struct WeeklyTotalRow {
	TimePoint week;
	double order_count = 0.0;
	double revenue = 0.0;
	double distinct_customers = 0.0;
	std::optional<double> average_order_value;
};

struct ProductUnitsRow {
	TimePoint week;
	std::string product;
	double units = 0.0;
};

/**
 * @struct MixRow
 * @brief Units of one product per size or variation over the trailing window.
 *
 * For sizes key and label are both the size; for variations key is the
 * variation id used by BOM lines and label its colour name.
 */
struct MixRow {
	std::string product;
	std::string key;
	std::string label;
	double units = 0.0;
};

struct StockRow {
	std::string fabric_colour_code;
	planning::FabricInfo fabric;
	std::optional<double> balance;
};

/// Weekly consumption of a fabric colour, already multiplied through the BOM.
struct FabricConsumptionRow {
	TimePoint week;
	std::string fabric_colour_code;
	double quantity = 0.0;
};

/// Recent consumption of a fabric colour attributable to one product.
struct ProductFabricConsumptionRow {
	std::string fabric_colour_code;
	std::string product;
	double quantity = 0.0;
};

/**
 * @struct PlanningInputs
 * @brief Everything a planning run reads from the data layer.
 */
struct PlanningInputs {
	std::vector<WeeklyTotalRow> weekly_totals;
	std::vector<ProductUnitsRow> product_units;
	std::vector<MixRow> size_mix;
	std::vector<MixRow> variation_mix;
	std::vector<planning::BomLine> bom_lines;
	std::vector<StockRow> fabric_stock;
	std::vector<FabricConsumptionRow> fabric_consumption;
	std::vector<ProductFabricConsumptionRow> product_fabric_consumption;
};

} // namespace bomcast::data
