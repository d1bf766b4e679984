#pragma once

#include <Eigen/Dense>

#include <functional>
#include <limits>

namespace bomcast::utils {

/**
 * @class NelderMeadOptimizer
 * @brief Derivative-free box-bounded minimiser with a hard iteration cap.
 *
 * The cap doubles as the fit timeout for model estimation: a run that has
 * not met the tolerance after max_iterations reports converged = false.
 */
class NelderMeadOptimizer {
public:
	using Objective = std::function<double(const Eigen::VectorXd &)>;

	struct Options {
		double alpha = 1.0;      // reflection
		double gamma = 2.0;      // expansion
		double rho = 0.5;        // contraction
		double sigma = 0.5;      // shrink
		double step = 0.1;       // initial simplex step
		int max_iterations = 200;
		double tolerance = 1e-6; // relative spread of simplex values
	};

	struct Result {
		Eigen::VectorXd best;
		double value = std::numeric_limits<double>::quiet_NaN();
		int iterations = 0;
		bool converged = false;
	};

	/**
	 * @param lower Per-coordinate lower bounds (empty = unbounded).
	 * @param upper Per-coordinate upper bounds (empty = unbounded).
	 */
	Result minimize(const Objective &objective, const Eigen::VectorXd &initial, const Options &options,
	                const Eigen::VectorXd &lower = Eigen::VectorXd(),
	                const Eigen::VectorXd &upper = Eigen::VectorXd()) const;

private:
	static void enforceBounds(Eigen::VectorXd &point, const Eigen::VectorXd &lower, const Eigen::VectorXd &upper);
	static bool withinTolerance(double best, double worst, double tolerance);
};

} // namespace bomcast::utils
