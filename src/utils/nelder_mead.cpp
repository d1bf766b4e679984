#include "bomcast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace bomcast::utils {

namespace {

struct Vertex {
	Eigen::VectorXd point;
	double value;
};

// Non-finite objective values rank last so the simplex moves away from them.
double sanitize(double value) {
	return std::isfinite(value) ? value : std::numeric_limits<double>::infinity();
}

void sortSimplex(std::vector<Vertex> &simplex) {
	std::stable_sort(simplex.begin(), simplex.end(),
	                 [](const Vertex &lhs, const Vertex &rhs) { return lhs.value < rhs.value; });
}

} // namespace

void NelderMeadOptimizer::enforceBounds(Eigen::VectorXd &point, const Eigen::VectorXd &lower,
                                        const Eigen::VectorXd &upper) {
	if (lower.size() == point.size()) {
		point = point.cwiseMax(lower);
	}
	if (upper.size() == point.size()) {
		point = point.cwiseMin(upper);
	}
}

bool NelderMeadOptimizer::withinTolerance(double best, double worst, double tolerance) {
	if (!std::isfinite(best) || !std::isfinite(worst)) {
		return false;
	}
	constexpr double tiny = 1e-12;
	return 2.0 * std::abs(worst - best) <= tolerance * (std::abs(worst) + std::abs(best)) + tiny;
}

NelderMeadOptimizer::Result NelderMeadOptimizer::minimize(const Objective &objective, const Eigen::VectorXd &initial,
                                                          const Options &options, const Eigen::VectorXd &lower,
                                                          const Eigen::VectorXd &upper) const {
	if (options.max_iterations <= 0) {
		throw std::invalid_argument("Nelder-Mead requires a positive iteration cap.");
	}

	Result result;
	const auto n = initial.size();
	if (n == 0) {
		return result;
	}

	std::vector<Vertex> simplex;
	simplex.reserve(static_cast<std::size_t>(n + 1));
	Eigen::VectorXd start = initial;
	enforceBounds(start, lower, upper);
	simplex.push_back({start, sanitize(objective(start))});
	for (Eigen::Index i = 0; i < n; ++i) {
		Eigen::VectorXd vertex = start;
		vertex[i] += options.step;
		enforceBounds(vertex, lower, upper);
		if (vertex[i] == start[i]) {
			// Pinned against an upper bound; step the other way.
			vertex[i] -= options.step;
			enforceBounds(vertex, lower, upper);
		}
		simplex.push_back({vertex, sanitize(objective(vertex))});
	}
	sortSimplex(simplex);

	for (int iter = 0; iter < options.max_iterations; ++iter) {
		result.iterations = iter + 1;
		if (withinTolerance(simplex.front().value, simplex.back().value, options.tolerance)) {
			result.converged = true;
			break;
		}

		Eigen::VectorXd center = Eigen::VectorXd::Zero(n);
		for (std::size_t i = 0; i + 1 < simplex.size(); ++i) {
			center += simplex[i].point;
		}
		center /= static_cast<double>(n);

		const Vertex worst = simplex.back();
		Eigen::VectorXd reflected = center + options.alpha * (center - worst.point);
		enforceBounds(reflected, lower, upper);
		const double reflected_value = sanitize(objective(reflected));

		if (reflected_value < simplex.front().value) {
			Eigen::VectorXd expanded = center + options.gamma * (reflected - center);
			enforceBounds(expanded, lower, upper);
			const double expanded_value = sanitize(objective(expanded));
			if (expanded_value < reflected_value) {
				simplex.back() = {expanded, expanded_value};
			} else {
				simplex.back() = {reflected, reflected_value};
			}
		} else if (reflected_value < simplex[simplex.size() - 2].value) {
			simplex.back() = {reflected, reflected_value};
		} else {
			Eigen::VectorXd contracted = center + options.rho * (worst.point - center);
			enforceBounds(contracted, lower, upper);
			const double contracted_value = sanitize(objective(contracted));
			if (contracted_value < worst.value) {
				simplex.back() = {contracted, contracted_value};
			} else {
				const Eigen::VectorXd best_point = simplex.front().point;
				for (std::size_t i = 1; i < simplex.size(); ++i) {
					simplex[i].point = best_point + options.sigma * (simplex[i].point - best_point);
					enforceBounds(simplex[i].point, lower, upper);
					simplex[i].value = sanitize(objective(simplex[i].point));
				}
			}
		}
		sortSimplex(simplex);
	}

	if (!result.converged &&
	    withinTolerance(simplex.front().value, simplex.back().value, options.tolerance)) {
		result.converged = true;
	}

	result.best = simplex.front().point;
	result.value = simplex.front().value;
	return result;
}

} // namespace bomcast::utils
