/**
 * @file demand_plan.cpp
 * @brief Runs a planning pass and prints the purchase plan
 *
 * Usage: bomcast_demo [--fabric] [--data <dir>]
 *
 * Without --data a small synthetic catalogue is generated: three products
 * with two colours each, six sizes and 130 weeks of history. --fabric
 * forecasts fabric colour consumption directly instead of allocating
 * product forecasts through the BOM.
 */

#include "bomcast/core/calendar.hpp"
#include "bomcast/data/csv_data_source.hpp"
#include "bomcast/data/data_source.hpp"
#include "bomcast/planning/demand_planner.hpp"
#include "bomcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace bomcast;

namespace {

constexpr int kHistoryWeeks = 130;
constexpr double kPi = 3.14159265358979323846;

struct Variation {
	std::string id;
	std::string colour;
	double weight;
	std::string fabric_code;
	std::string fabric_colour;
};

struct Product {
	std::string name;
	double base_units;
	std::string fabric_name;
	double qty_per_unit;
	double cost_per_unit;
	std::vector<Variation> variations;
};

const std::vector<std::pair<std::string, double>> kSizes = {{"S", 0.15}, {"M", 0.30}, {"L", 0.30},
                                                            {"XL", 0.15}, {"2XL", 0.07}, {"3XL", 0.03}};

std::vector<Product> catalogue() {
	return {
	    {"Classic Tee", 60.0, "Cotton Jersey", 1.2, 180.0,
	     {{"TEE-BLK", "Black", 0.6, "CJ-BLK", "Black"}, {"TEE-WHT", "White", 0.4, "CJ-WHT", "White"}}},
	    {"Linen Shirt", 25.0, "Linen", 1.8, 420.0,
	     {{"LIN-SND", "Sand", 0.7, "LN-SND", "Sand"}, {"LIN-OLV", "Olive", 0.3, "LN-OLV", "Olive"}}},
	    {"Lounge Pant", 12.0, "French Terry", 1.5, 260.0,
	     {{"LNG-GRY", "Grey", 0.5, "FT-GRY", "Grey"}, {"LNG-NVY", "Navy", 0.5, "FT-NVY", "Navy"}}},
	};
}

data::PlanningInputs syntheticInputs() {
	data::PlanningInputs inputs;
	const auto first_week = core::calendar::fromCivil(2023, 1, 2);

	for (int i = 0; i < kHistoryWeeks; ++i) {
		const auto week = core::calendar::addWeeks(first_week, i);
		const double season = 1.0 + 0.25 * std::sin(2.0 * kPi * i / 52.0);
		const double noise = static_cast<double>((i * 7) % 11) - 5.0;

		double orders = 0.0;
		for (const auto &product : catalogue()) {
			const double units = std::max(0.0, std::round(product.base_units * season * (1.0 + 0.004 * i) + noise));
			inputs.product_units.push_back(data::ProductUnitsRow{week, product.name, units});
			orders += units * 0.8;
			for (const auto &variation : product.variations) {
				inputs.fabric_consumption.push_back(data::FabricConsumptionRow{
				    week, variation.fabric_code, units * variation.weight * product.qty_per_unit * 1.05});
			}
		}
		data::WeeklyTotalRow total;
		total.week = week;
		total.order_count = std::round(orders);
		total.revenue = total.order_count * 1450.0;
		total.distinct_customers = std::round(orders * 0.9);
		inputs.weekly_totals.push_back(total);
	}

	for (const auto &product : catalogue()) {
		const double recent_units = product.base_units * 26.0;
		for (const auto &size : kSizes) {
			inputs.size_mix.push_back(data::MixRow{product.name, size.first, size.first, recent_units * size.second});
		}
		for (const auto &variation : product.variations) {
			inputs.variation_mix.push_back(
			    data::MixRow{product.name, variation.id, variation.colour, recent_units * variation.weight});
			for (const auto &size : kSizes) {
				planning::BomLine line;
				line.product = product.name;
				line.variation = variation.id;
				line.size = size.first;
				line.fabric_colour_code = variation.fabric_code;
				line.fabric = planning::FabricInfo{product.fabric_name, "m", variation.fabric_colour,
				                                   product.cost_per_unit};
				line.qty_per_unit = product.qty_per_unit;
				inputs.bom_lines.push_back(std::move(line));
			}
			inputs.product_fabric_consumption.push_back(data::ProductFabricConsumptionRow{
			    variation.fabric_code, product.name, recent_units * variation.weight * product.qty_per_unit / 6.0});

			data::StockRow stock;
			stock.fabric_colour_code = variation.fabric_code;
			stock.fabric = planning::FabricInfo{product.fabric_name, "m", variation.fabric_colour, product.cost_per_unit};
			stock.balance = variation.weight > 0.5 ? 150.0 : 900.0;
			inputs.fabric_stock.push_back(std::move(stock));
		}
	}
	return inputs;
}

void printSeparator(const std::string &title) {
	std::cout << "\n" << std::string(72, '=') << "\n" << title << "\n" << std::string(72, '=') << "\n";
}

void printReport(const planning::PlanResult &result) {
	std::cout << std::fixed;
	printSeparator("DEMAND FORECAST as of " + core::calendar::formatIsoDate(result.as_of) + " (" +
	               planning::toString(result.mode) + ")");
	std::cout << "Data: " << std::setprecision(0) << result.overall.total_orders << " orders over "
	          << result.overall.weeks_of_data << " weeks\n";
	std::cout << "Recent 12w avg: " << std::setprecision(1) << result.overall.recent_avg_orders
	          << "/wk | AOV: " << std::setprecision(0) << result.overall.recent_aov << "\n";

	if (result.overall_forecast) {
		std::cout << "\nOverall orders (" << core::toString(result.overall_forecast->method) << ")\n";
		for (std::size_t i = 0; i < result.overall_forecast->points.size(); ++i) {
			const auto &point = result.overall_forecast->points[i];
			std::cout << "  " << core::calendar::formatIsoDate(point.week) << std::setw(8) << std::setprecision(1)
			          << point.forecast << "  revenue " << std::setprecision(0) << result.revenue_forecast[i].forecast
			          << "\n";
		}
	}

	for (const auto &product : result.products) {
		std::cout << "\n" << std::string(60, '-') << "\n";
		std::cout << product.name << " - " << std::setprecision(0) << product.forecast.total << " units ("
		          << result.horizon_weeks << "wk, " << core::toString(product.forecast.method) << ")\n";
		for (const auto &point : product.forecast.points) {
			std::cout << "  " << core::calendar::formatIsoDate(point.week) << std::setw(8) << point.forecast << "  ("
			          << point.low << "-" << point.high << ")\n";
		}
		std::cout << "  sizes:";
		for (const auto &size : product.size_breakdown) {
			std::cout << " " << size.label << "=" << size.units;
		}
		std::cout << "\n  colours:";
		for (const auto &colour : product.colour_breakdown) {
			std::cout << " " << colour.label << "=" << colour.units;
		}
		std::cout << "\n";
	}

	printSeparator("FABRIC REQUIREMENTS");
	for (const auto &group : result.fabric_requirements) {
		std::cout << "\n" << group.fabric_name << " - " << std::setprecision(1) << group.total_required << " "
		          << group.unit << "\n";
		for (const auto &colour : group.colours) {
			std::cout << "  " << std::left << std::setw(10) << colour.code << std::setw(10) << colour.colour_name
			          << std::right << " need:" << std::setw(8) << colour.required_qty << "  stock:" << std::setw(8)
			          << colour.in_stock << "  ";
			if (colour.gap > 0.0) {
				std::cout << "ORDER " << colour.gap;
			} else {
				std::cout << "OK (+" << -colour.gap << ")";
			}
			for (const auto &driver : colour.drivers) {
				std::cout << " [" << driver.product << " " << std::setprecision(0) << driver.share * 100.0 << "%]"
				          << std::setprecision(1);
			}
			std::cout << "\n";
		}
	}

	const auto &summary = result.summary;
	printSeparator("SUMMARY");
	std::cout << std::setprecision(0) << summary.total_forecast_units << " units | " << summary.shortfall_count
	          << " fabrics to order | " << summary.covered_by_stock << " covered by stock\n";
	if (summary.estimated_purchase_cost > 0.0) {
		std::cout << "Est. purchase: " << summary.estimated_purchase_cost << "\n";
	}
	for (const auto &count : summary.method_counts) {
		std::cout << "  " << core::toString(count.first) << ": " << count.second << "\n";
	}
}

} // namespace

int main(int argc, char **argv) {
	utils::Logging::initFromEnvironment();

	planning::PlanningConfig config;
	std::string data_dir;
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--fabric") {
			config.mode = planning::ExplosionMode::FabricDirect;
		} else if (arg == "--data" && i + 1 < argc) {
			data_dir = argv[++i];
		} else {
			std::cerr << "Usage: " << argv[0] << " [--fabric] [--data <dir>]\n";
			return 2;
		}
	}

	std::unique_ptr<data::IDataSource> source;
	if (data_dir.empty()) {
		source = std::make_unique<data::InMemoryDataSource>(syntheticInputs());
	} else {
		source = std::make_unique<data::CsvDataSource>(data_dir);
	}

	try {
		const planning::DemandPlanner planner(config);
		printReport(planner.run(*source));
	} catch (const data::UpstreamDataError &e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	} catch (const std::invalid_argument &e) {
		std::cerr << "Invalid configuration: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
