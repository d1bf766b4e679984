#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "bomcast/utils/nelder_mead.hpp"

#include <cmath>
#include <stdexcept>

using bomcast::utils::NelderMeadOptimizer;

TEST_CASE("Nelder-Mead finds the minimum of a quadratic", "[utils][nelder-mead]") {
	NelderMeadOptimizer optimizer;
	const auto objective = [](const Eigen::VectorXd &x) {
		return (x[0] - 1.5) * (x[0] - 1.5) + 2.0 * (x[1] + 0.5) * (x[1] + 0.5);
	};
	NelderMeadOptimizer::Options options;
	options.max_iterations = 1000;
	options.tolerance = 1e-10;

	const auto result = optimizer.minimize(objective, Eigen::VectorXd::Zero(2), options);
	REQUIRE(result.converged);
	REQUIRE(result.best[0] == Catch::Approx(1.5).margin(1e-3));
	REQUIRE(result.best[1] == Catch::Approx(-0.5).margin(1e-3));
	REQUIRE(result.value == Catch::Approx(0.0).margin(1e-6));
	REQUIRE(result.iterations <= 1000);
}

TEST_CASE("Bounds keep the search inside the box", "[utils][nelder-mead]") {
	NelderMeadOptimizer optimizer;
	const auto objective = [](const Eigen::VectorXd &x) { return (x[0] - 3.0) * (x[0] - 3.0); };
	Eigen::VectorXd lower(1);
	lower << -0.99;
	Eigen::VectorXd upper(1);
	upper << 0.99;

	NelderMeadOptimizer::Options options;
	options.max_iterations = 300;
	const auto result = optimizer.minimize(objective, Eigen::VectorXd::Zero(1), options, lower, upper);
	REQUIRE(result.best[0] <= 0.99);
	REQUIRE(result.best[0] == Catch::Approx(0.99).margin(1e-3));
}

TEST_CASE("The iteration cap ends an unconverged search", "[utils][nelder-mead]") {
	NelderMeadOptimizer optimizer;
	const auto rosenbrock = [](const Eigen::VectorXd &x) {
		return 100.0 * std::pow(x[1] - x[0] * x[0], 2) + std::pow(1.0 - x[0], 2);
	};
	NelderMeadOptimizer::Options options;
	options.max_iterations = 3;
	options.tolerance = 1e-12;
	Eigen::VectorXd start(2);
	start << -1.2, 1.0;

	const auto result = optimizer.minimize(rosenbrock, start, options);
	REQUIRE_FALSE(result.converged);
	REQUIRE(result.iterations == 3);
}

TEST_CASE("Non-finite objective values are avoided", "[utils][nelder-mead]") {
	NelderMeadOptimizer optimizer;
	const auto objective = [](const Eigen::VectorXd &x) {
		return x[0] < 0.0 ? std::nan("") : (x[0] - 0.5) * (x[0] - 0.5);
	};
	NelderMeadOptimizer::Options options;
	options.max_iterations = 300;
	const auto result = optimizer.minimize(objective, Eigen::VectorXd::Constant(1, 0.05), options);
	REQUIRE(std::isfinite(result.value));
	REQUIRE(result.best[0] == Catch::Approx(0.5).margin(1e-2));
}

TEST_CASE("Invalid optimiser input", "[utils][nelder-mead]") {
	NelderMeadOptimizer optimizer;
	const auto objective = [](const Eigen::VectorXd &) { return 0.0; };
	NelderMeadOptimizer::Options options;
	options.max_iterations = 0;
	REQUIRE_THROWS_AS(optimizer.minimize(objective, Eigen::VectorXd::Zero(1), options), std::invalid_argument);

	options.max_iterations = 10;
	const auto result = optimizer.minimize(objective, Eigen::VectorXd(), options);
	REQUIRE(result.iterations == 0);
	REQUIRE(result.best.size() == 0);
}
