#pragma once

#include "bomcast/models/iforecaster.hpp"
#include "bomcast/utils/logging.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <vector>

namespace bomcast::models {

class SarimaBuilder;

/**
 * @class Sarima
 * @brief Multiplicative seasonal ARIMA(p,d,q)(P,D,Q)[s] fitted by conditional
 * sum of squares.
 *
 * Coefficients are estimated with a bounded Nelder-Mead search; a search
 * that does not converge within the iteration cap raises
 * core::ConvergenceError. Prediction intervals use the psi-weight expansion
 * of the integrated model.
 */
class Sarima final : public IForecaster {
public:
	friend class SarimaBuilder;

	void fit(const core::WeeklySeries &series) override;
	core::Forecast predict(int horizon) override;
	core::Forecast predictWithConfidence(int horizon, double confidence);

	std::string getName() const override {
		return seasonal_period_ > 1 && (P_ > 0 || D_ > 0 || Q_ > 0) ? "SARIMA" : "ARIMA";
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	const Eigen::VectorXd &seasonalARCoefficients() const {
		return seasonal_ar_coeffs_;
	}
	const Eigen::VectorXd &seasonalMACoefficients() const {
		return seasonal_ma_coeffs_;
	}
	double sigma2() const {
		return sigma2_;
	}
	int iterations() const {
		return iterations_;
	}
	std::optional<double> aic() const {
		return aic_;
	}

	/// Smallest series length the configured orders can be fitted on.
	std::size_t minimumObservations() const;

	static std::vector<double> difference(const std::vector<double> &data, int d);
	static std::vector<double> seasonalDifference(const std::vector<double> &data, int D, int s);

	/// Product of two lag polynomials given as coefficient vectors (index = lag).
	static std::vector<double> multiplyPolynomials(const std::vector<double> &lhs, const std::vector<double> &rhs);

	static double normalQuantile(double p);

private:
	Sarima(int p, int d, int q, int P, int D, int Q, int s, bool include_mean, int max_iterations);

	struct Polynomials {
		std::vector<double> ar; // phi(B) * Phi(B^s), leading 1
		std::vector<double> ma; // theta(B) * Theta(B^s), leading 1
	};

	Polynomials buildPolynomials(const Eigen::VectorXd &params) const;
	double conditionalSumOfSquares(const Eigen::VectorXd &params, std::vector<double> *residuals) const;
	std::vector<double> psiWeights(int horizon) const;

	int p_, d_, q_;
	int P_, D_, Q_;
	int seasonal_period_;
	bool include_mean_;
	int max_iterations_;

	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	Eigen::VectorXd seasonal_ar_coeffs_;
	Eigen::VectorXd seasonal_ma_coeffs_;
	std::vector<double> full_ar_; // includes the differencing operators
	std::vector<double> ma_poly_;

	std::vector<double> history_;
	std::vector<double> differenced_;
	std::vector<double> residuals_; // aligned with history_
	double mean_ = 0.0;
	double sigma2_ = 0.0;
	int iterations_ = 0;
	std::optional<double> aic_;
	bool is_fitted_ = false;
};

class SarimaBuilder {
public:
	SarimaBuilder &withAR(int p);
	SarimaBuilder &withDifferencing(int d);
	SarimaBuilder &withMA(int q);
	SarimaBuilder &withSeasonalAR(int P);
	SarimaBuilder &withSeasonalDifferencing(int D);
	SarimaBuilder &withSeasonalMA(int Q);
	SarimaBuilder &withSeasonalPeriod(int s);
	SarimaBuilder &withMean(bool include_mean);
	SarimaBuilder &withMaxIterations(int max_iterations);
	std::unique_ptr<Sarima> build();

private:
	int p_ = 0;
	int d_ = 0;
	int q_ = 0;
	int P_ = 0;
	int D_ = 0;
	int Q_ = 0;
	int s_ = 0;
	bool include_mean_ = true;
	int max_iterations_ = 200;
};

} // namespace bomcast::models
