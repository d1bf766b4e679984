#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/planning/requirements_explosion.hpp"

#include <stdexcept>

using bomcast::core::ForecastMethod;
using bomcast::planning::BomLine;
using bomcast::planning::BomProportion;
using bomcast::planning::BomTable;
using bomcast::planning::FabricDemand;
using bomcast::planning::FabricInfo;
using bomcast::planning::MaterialDemand;
using bomcast::planning::ProductDemand;
using bomcast::planning::RequirementsExplosion;

namespace {

BomLine line(std::string product, std::string variation, std::string size, std::string code, double qty,
             std::optional<double> wastage = std::nullopt) {
	BomLine result;
	result.product = std::move(product);
	result.variation = std::move(variation);
	result.size = std::move(size);
	result.fabric_colour_code = code;
	result.fabric = FabricInfo{"Cotton", "m", code + "-colour", 4.0};
	result.qty_per_unit = qty;
	result.wastage_percent = wastage;
	return result;
}

BomTable catalogue() {
	return BomTable({line("Dress", "d-red", "S", "FC-RED", 2.0), line("Dress", "d-red", "M", "FC-RED", 2.5),
	                 line("Dress", "d-blue", "S", "FC-BLUE", 2.0), line("Dress", "d-blue", "M", "FC-BLUE", 2.5),
	                 line("Dress", "d-blue", "M", "FC-TRIM", 0.1, 0.0),
	                 line("Shirt", "s-red", "M", "FC-RED", 1.0, 10.0)});
}

BomProportion dressColours() {
	return BomProportion::fromUnits({{"d-red", "Red", 60.0}, {"d-blue", "Blue", 40.0}});
}

BomProportion dressSizes() {
	return BomProportion::fromUnits({{"S", "S", 50.0}, {"M", "M", 50.0}});
}

} // namespace

TEST_CASE("Product units explode through variation and size shares", "[planning][explosion]") {
	const auto bom = catalogue();
	RequirementsExplosion explosion(bom, 5.0);
	MaterialDemand demand;
	explosion.allocate({"Dress", 100.0, ForecastMethod::Ensemble}, dressColours(), dressSizes(), demand);

	// red: 30 S * 2.0 + 30 M * 2.5 = 135, blue: 20 * 2.0 + 20 * 2.5 = 90, each with 5% wastage.
	REQUIRE(demand.size() == 3);
	REQUIRE(demand.find("FC-RED")->required_qty == Catch::Approx(135.0 * 1.05));
	REQUIRE(demand.find("FC-BLUE")->required_qty == Catch::Approx(90.0 * 1.05));
	// Zero line wastage falls back to the default.
	REQUIRE(demand.find("FC-TRIM")->required_qty == Catch::Approx(20.0 * 0.1 * 1.05));
	REQUIRE(demand.find("FC-RED")->dominantMethod() == ForecastMethod::Ensemble);

	const auto &stats = explosion.stats();
	REQUIRE(stats.products_allocated == 1);
	REQUIRE(stats.paths_visited == 4);
	REQUIRE(stats.missing_paths == 0);
	REQUIRE(stats.lines_applied == 5);
}

TEST_CASE("Contribution order does not change totals", "[planning][explosion]") {
	const auto bom = catalogue();
	const auto shirt_colours = BomProportion::fromUnits({{"s-red", "Red", 1.0}});
	const auto shirt_sizes = BomProportion::fromUnits({{"M", "M", 1.0}});
	const ProductDemand dress{"Dress", 100.0, ForecastMethod::Ensemble};
	const ProductDemand shirt{"Shirt", 40.0, ForecastMethod::AverageFallback};

	MaterialDemand forward;
	RequirementsExplosion a(bom, 5.0);
	a.allocate(dress, dressColours(), dressSizes(), forward);
	a.allocate(shirt, shirt_colours, shirt_sizes, forward);

	MaterialDemand backward;
	RequirementsExplosion b(bom, 5.0);
	b.allocate(shirt, shirt_colours, shirt_sizes, backward);
	b.allocate(dress, dressColours(), dressSizes(), backward);

	REQUIRE(forward.size() == backward.size());
	for (const auto &entry : forward.entries()) {
		const auto *other = backward.find(entry.code);
		REQUIRE(other != nullptr);
		REQUIRE(other->required_qty == Catch::Approx(entry.required_qty));
	}
	// Shirt line wastage 10%: 40 * 1.0 * 1.1.
	REQUIRE(forward.find("FC-RED")->required_qty == Catch::Approx(135.0 * 1.05 + 44.0));
	REQUIRE(forward.find("FC-RED")->qty_by_method[static_cast<std::size_t>(ForecastMethod::AverageFallback)] ==
	        Catch::Approx(44.0));
	REQUIRE(forward.totalRequired() == Catch::Approx(backward.totalRequired()));
}

TEST_CASE("Exploding the same forecast twice gives the same result", "[planning][explosion]") {
	const auto bom = catalogue();
	const ProductDemand dress{"Dress", 73.0, ForecastMethod::Tree};

	MaterialDemand first;
	RequirementsExplosion(bom, 5.0).allocate(dress, dressColours(), dressSizes(), first);
	MaterialDemand second;
	RequirementsExplosion(bom, 5.0).allocate(dress, dressColours(), dressSizes(), second);

	REQUIRE(first.size() == second.size());
	for (std::size_t i = 0; i < first.size(); ++i) {
		REQUIRE(first.entries()[i].code == second.entries()[i].code);
		REQUIRE(first.entries()[i].required_qty == second.entries()[i].required_qty);
	}
}

TEST_CASE("Products without BOM lines contribute nothing", "[planning][explosion]") {
	const auto bom = catalogue();
	RequirementsExplosion explosion(bom, 5.0);
	MaterialDemand demand;

	const auto colours = BomProportion::fromUnits({{"c-green", "Green", 10.0}});
	const auto sizes = BomProportion::fromUnits({{"S", "S", 3.0}, {"M", "M", 7.0}});
	REQUIRE_NOTHROW(explosion.allocate({"Coat", 50.0, ForecastMethod::Ensemble}, colours, sizes, demand));
	REQUIRE(demand.empty());
	REQUIRE(explosion.stats().paths_visited == 2);
	REQUIRE(explosion.stats().missing_paths == 2);

	// Sizes with a share but no line for that variation are skipped individually.
	const auto wide = BomProportion::fromUnits({{"S", "S", 1.0}, {"XL", "XL", 1.0}});
	explosion.allocate({"Dress", 10.0, ForecastMethod::Ensemble}, dressColours(), wide, demand);
	REQUIRE(explosion.stats().missing_paths == 4);
	REQUIRE(demand.find("FC-RED")->required_qty == Catch::Approx(3.0 * 2.0 * 1.05));
}

TEST_CASE("Empty shares or zero units skip allocation", "[planning][explosion]") {
	const auto bom = catalogue();
	RequirementsExplosion explosion(bom, 5.0);
	MaterialDemand demand;
	explosion.allocate({"Dress", 100.0, ForecastMethod::Ensemble}, BomProportion{}, dressSizes(), demand);
	explosion.allocate({"Dress", 0.0, ForecastMethod::Ensemble}, dressColours(), dressSizes(), demand);
	REQUIRE(demand.empty());
	REQUIRE(explosion.stats().products_allocated == 0);
}

TEST_CASE("Direct fabric forecasts add as-is", "[planning][explosion]") {
	const auto bom = catalogue();
	RequirementsExplosion explosion(bom, 5.0);
	MaterialDemand demand;
	const FabricInfo info{"Cotton", "m", "Red", 4.0};
	explosion.addDirect({"FC-RED", info, 12.5, ForecastMethod::Seasonal}, demand);
	explosion.addDirect({"FC-RED", info, 7.5, ForecastMethod::Tree}, demand);

	REQUIRE(demand.size() == 1);
	REQUIRE(demand.find("FC-RED")->required_qty == Catch::Approx(20.0));
	REQUIRE(demand.find("FC-RED")->dominantMethod() == ForecastMethod::Seasonal);
	REQUIRE(explosion.stats().direct_entries == 2);
}

TEST_CASE("Material demand is additive and freezable", "[planning][explosion]") {
	const FabricInfo first{"Linen", "m", "Sand", 3.0};
	const FabricInfo later{"Other", "yd", "Beige", 9.0};

	MaterialDemand demand;
	demand.add("FC-1", first, 2.0, ForecastMethod::Tree);
	demand.add("FC-2", first, 1.0, ForecastMethod::Tree);
	demand.add("FC-1", later, 3.0, ForecastMethod::Ensemble);

	REQUIRE(demand.entries().front().code == "FC-1");
	REQUIRE(demand.find("FC-1")->required_qty == Catch::Approx(5.0));
	REQUIRE(demand.find("FC-1")->fabric.fabric_name == "Linen");
	REQUIRE(demand.find("FC-1")->dominantMethod() == ForecastMethod::Ensemble);
	REQUIRE(demand.find("FC-404") == nullptr);
	REQUIRE_THROWS_AS(demand.add("", first, 1.0, ForecastMethod::Tree), std::invalid_argument);

	MaterialDemand merged;
	merged.add("FC-2", first, 4.0, ForecastMethod::Seasonal);
	merged.merge(demand);
	REQUIRE(merged.find("FC-2")->required_qty == Catch::Approx(5.0));
	REQUIRE(merged.totalRequired() == Catch::Approx(10.0));

	demand.freeze();
	REQUIRE(demand.frozen());
	REQUIRE_THROWS_AS(demand.add("FC-1", first, 1.0, ForecastMethod::Tree), std::logic_error);
}

TEST_CASE("Negative default wastage is rejected", "[planning][explosion]") {
	const auto bom = catalogue();
	REQUIRE_THROWS_AS(RequirementsExplosion(bom, -1.0), std::invalid_argument);
}
