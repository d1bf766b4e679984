#include <catch2/catch_test_macros.hpp>

#include "bomcast/planning/planning_config.hpp"

#include <cstring>
#include <stdexcept>

using bomcast::planning::ExplosionMode;
using bomcast::planning::PlanningConfig;

TEST_CASE("Planning defaults", "[planning][config]") {
	const PlanningConfig config;
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.horizon_weeks == 8);
	REQUIRE(config.default_wastage_percent == 5.0);
	REQUIRE(config.min_history_weeks_for_models == 30);
	REQUIRE(config.min_active_weeks == 4);
	REQUIRE(config.mode == ExplosionMode::ProductAllocation);
	REQUIRE(config.product_seasonal.isSeasonal());
	REQUIRE_FALSE(config.fabric_seasonal.isSeasonal());
	REQUIRE(config.ensemble.seasonal_weight == 0.4);
	REQUIRE(config.ensemble.tree_weight == 0.6);
}

TEST_CASE("Selection policy mirrors the planning settings", "[planning][config]") {
	PlanningConfig config;
	config.horizon_weeks = 12;
	config.min_history_weeks_for_models = 40;
	config.min_active_weeks = 2;
	config.average_window_weeks = 6;

	const auto policy = config.selectionPolicy();
	REQUIRE(policy.horizon_weeks == 12);
	REQUIRE(policy.min_history_weeks == 40);
	REQUIRE(policy.min_active_weeks == 2);
	REQUIRE(policy.activity_window_weeks == 8);
	REQUIRE(policy.average_window_weeks == 6);
}

TEST_CASE("Invalid planning settings are rejected", "[planning][config]") {
	PlanningConfig config;
	config.default_wastage_percent = -1.0;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = PlanningConfig{};
	config.horizon_weeks = 0;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = PlanningConfig{};
	config.size_order.clear();
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = PlanningConfig{};
	config.ensemble.tree_weight = 0.7;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = PlanningConfig{};
	config.tree.max_depth = 0;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

	config = PlanningConfig{};
	config.max_detailed_products = 0;
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
}

TEST_CASE("Explosion mode names", "[planning][config]") {
	REQUIRE(std::strcmp(toString(ExplosionMode::ProductAllocation), "product-allocation") == 0);
	REQUIRE(std::strcmp(toString(ExplosionMode::FabricDirect), "fabric-direct") == 0);
}
