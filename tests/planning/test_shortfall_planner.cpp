#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/planning/shortfall_planner.hpp"

using bomcast::core::ForecastMethod;
using bomcast::planning::FabricInfo;
using bomcast::planning::MaterialDemand;
using bomcast::planning::ShortfallPlanner;
using bomcast::planning::StockSnapshot;

namespace {

const FabricInfo kLinenSand{"Linen", "m", "Sand", 10.0};
const FabricInfo kLinenNavy{"Linen", "m", "Navy", 12.0};
const FabricInfo kSilkRose{"Silk", "m", "Rose", 30.0};

} // namespace

TEST_CASE("Gaps become orders priced at the colour cost", "[planning][shortfall]") {
	MaterialDemand demand;
	demand.add("FC-SAND", kLinenSand, 120.0, ForecastMethod::Ensemble);
	demand.add("FC-ROSE", kSilkRose, 15.0, ForecastMethod::Tree);
	demand.freeze();

	const auto report = ShortfallPlanner(StockSnapshot{{"FC-SAND", 100.0}}).plan(demand);
	REQUIRE(report.shortfalls.size() == 2);

	const auto &sand = report.shortfalls[0];
	REQUIRE(sand.code == "FC-SAND");
	REQUIRE(sand.required_qty == Catch::Approx(120.0));
	REQUIRE(sand.in_stock == Catch::Approx(100.0));
	REQUIRE(sand.to_order == Catch::Approx(20.0));
	REQUIRE(sand.estimated_cost == Catch::Approx(200.0));

	// Not in the snapshot: zero stock.
	const auto &rose = report.shortfalls[1];
	REQUIRE(rose.in_stock == 0.0);
	REQUIRE(rose.to_order == Catch::Approx(15.0));
	REQUIRE(rose.estimated_cost == Catch::Approx(450.0));

	REQUIRE(report.total_estimated_cost == Catch::Approx(650.0));
	REQUIRE(report.covered_by_stock == 0);
}

TEST_CASE("Stock above the requirement counts as covered", "[planning][shortfall]") {
	MaterialDemand demand;
	demand.add("FC-NAVY", kLinenNavy, 40.0, ForecastMethod::Seasonal);
	demand.add("FC-SAND", kLinenSand, 50.0, ForecastMethod::Seasonal);

	const auto report = ShortfallPlanner(StockSnapshot{{"FC-NAVY", 75.5}, {"FC-SAND", 50.0}}).plan(demand);
	REQUIRE(report.shortfalls.empty());
	REQUIRE(report.covered_by_stock == 2);
	REQUIRE(report.total_estimated_cost == 0.0);

	REQUIRE(report.groups.size() == 1);
	const auto &navy = report.groups[0].colours[1];
	REQUIRE(navy.code == "FC-NAVY");
	REQUIRE(navy.gap == Catch::Approx(-35.5));
	REQUIRE(navy.order_cost == 0.0);
}

TEST_CASE("Shortfalls sort by requirement and keep ties stable", "[planning][shortfall]") {
	MaterialDemand demand;
	demand.add("FC-A", kLinenSand, 10.0, ForecastMethod::Tree);
	demand.add("FC-B", kLinenNavy, 30.0, ForecastMethod::Tree);
	demand.add("FC-C", kSilkRose, 10.0, ForecastMethod::Tree);
	demand.add("FC-D", kSilkRose, 20.0, ForecastMethod::Tree);

	const auto report = ShortfallPlanner(StockSnapshot{}).plan(demand);
	REQUIRE(report.shortfalls.size() == 4);
	REQUIRE(report.shortfalls[0].code == "FC-B");
	REQUIRE(report.shortfalls[1].code == "FC-D");
	REQUIRE(report.shortfalls[2].code == "FC-A");
	REQUIRE(report.shortfalls[3].code == "FC-C");
}

TEST_CASE("Requirements group by fabric with colours ordered by need", "[planning][shortfall]") {
	MaterialDemand demand;
	demand.add("FC-SAND", kLinenSand, 5.0, ForecastMethod::Ensemble);
	demand.add("FC-ROSE", kSilkRose, 30.0, ForecastMethod::Tree);
	demand.add("FC-NAVY", kLinenNavy, 20.0, ForecastMethod::Seasonal);
	demand.add("FC-NAVY", kLinenNavy, 25.0, ForecastMethod::AverageFallback);

	const auto report = ShortfallPlanner(StockSnapshot{{"FC-SAND", 2.0}}).plan(demand);
	REQUIRE(report.groups.size() == 2);

	const auto &linen = report.groups[0];
	REQUIRE(linen.fabric_name == "Linen");
	REQUIRE(linen.unit == "m");
	REQUIRE(linen.total_required == Catch::Approx(50.0));
	REQUIRE(linen.colours.size() == 2);
	REQUIRE(linen.colours[0].code == "FC-NAVY");
	REQUIRE(linen.colours[0].colour_name == "Navy");
	REQUIRE(linen.colours[0].method == ForecastMethod::AverageFallback);
	REQUIRE(linen.colours[1].code == "FC-SAND");
	REQUIRE(linen.colours[1].gap == Catch::Approx(3.0));
	REQUIRE(linen.colours[1].order_cost == Catch::Approx(30.0));

	REQUIRE(report.groups[1].fabric_name == "Silk");
	REQUIRE(report.groups[1].total_required == Catch::Approx(30.0));
}

TEST_CASE("Stock lookup defaults to zero", "[planning][shortfall]") {
	const ShortfallPlanner planner(StockSnapshot{{"FC-1", 4.0}});
	REQUIRE(planner.inStock("FC-1") == 4.0);
	REQUIRE(planner.inStock("FC-2") == 0.0);
	REQUIRE(planner.plan(MaterialDemand{}).groups.empty());
}
