#include "bomcast/models/sarima.hpp"

#include "bomcast/core/model_result.hpp"
#include "bomcast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace bomcast::models {

namespace {

constexpr double kCoefficientBound = 0.99;
constexpr std::size_t kMinResidualObservations = 10;
constexpr double kPi = 3.14159265358979323846;

double autocorrelation(const std::vector<double> &data, int lag) {
	const std::size_t n = data.size();
	if (n <= static_cast<std::size_t>(lag)) {
		return 0.0;
	}
	const double mean = std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(n);
	double variance = 0.0;
	for (double value : data) {
		variance += (value - mean) * (value - mean);
	}
	if (variance == 0.0) {
		return 0.0;
	}
	double covariance = 0.0;
	for (std::size_t i = static_cast<std::size_t>(lag); i < n; ++i) {
		covariance += (data[i] - mean) * (data[i - static_cast<std::size_t>(lag)] - mean);
	}
	return covariance / variance;
}

// Yule-Walker starting values for the non-seasonal AR block.
Eigen::VectorXd yuleWalker(const std::vector<double> &data, int p) {
	if (p == 0) {
		return Eigen::VectorXd();
	}
	Eigen::VectorXd acf(p + 1);
	for (int lag = 0; lag <= p; ++lag) {
		acf[lag] = lag == 0 ? 1.0 : autocorrelation(data, lag);
	}
	Eigen::MatrixXd R(p, p);
	for (int i = 0; i < p; ++i) {
		for (int j = 0; j < p; ++j) {
			R(i, j) = acf[std::abs(i - j)];
		}
	}
	Eigen::VectorXd phi = R.colPivHouseholderQr().solve(acf.segment(1, p));
	for (Eigen::Index i = 0; i < phi.size(); ++i) {
		if (!std::isfinite(phi[i])) {
			phi[i] = 0.0;
		}
	}
	return phi.cwiseMax(-0.9).cwiseMin(0.9);
}

std::string formatCoefficients(const Eigen::VectorXd &coeffs) {
	std::stringstream ss;
	ss << coeffs.transpose();
	return ss.str();
}

} // namespace

Sarima::Sarima(int p, int d, int q, int P, int D, int Q, int s, bool include_mean, int max_iterations)
    : p_(p), d_(d), q_(q), P_(P), D_(D), Q_(Q), seasonal_period_(s), include_mean_(include_mean),
      max_iterations_(max_iterations) {
	if (p < 0 || d < 0 || q < 0) {
		throw std::invalid_argument("ARIMA orders (p, d, q) must be non-negative.");
	}
	if (P < 0 || D < 0 || Q < 0) {
		throw std::invalid_argument("Seasonal ARIMA orders (P, D, Q) must be non-negative.");
	}
	if (seasonal_period_ < 0) {
		throw std::invalid_argument("Seasonal period must be non-negative.");
	}
	if ((P > 0 || Q > 0 || D > 0) && seasonal_period_ < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for seasonal ARIMA components.");
	}
	if (p == 0 && q == 0 && P == 0 && Q == 0) {
		throw std::invalid_argument("At least one of p, q, P, or Q must be greater than zero.");
	}
	if (max_iterations <= 0) {
		throw std::invalid_argument("ARIMA iteration cap must be positive.");
	}
}

std::vector<double> Sarima::difference(const std::vector<double> &data, int d) {
	if (d == 0) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(d)) {
		throw core::InsufficientHistoryError("Insufficient data length for requested differencing order.");
	}
	std::vector<double> result = data;
	for (int order = 0; order < d; ++order) {
		std::vector<double> next;
		next.reserve(result.size() - 1);
		for (std::size_t i = 1; i < result.size(); ++i) {
			next.push_back(result[i] - result[i - 1]);
		}
		result = std::move(next);
	}
	return result;
}

std::vector<double> Sarima::seasonalDifference(const std::vector<double> &data, int D, int s) {
	if (D == 0 || s <= 1) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(D * s)) {
		throw core::InsufficientHistoryError("Insufficient data length for requested seasonal differencing order.");
	}
	const std::size_t lag = static_cast<std::size_t>(s);
	std::vector<double> result = data;
	for (int order = 0; order < D; ++order) {
		std::vector<double> next;
		next.reserve(result.size() - lag);
		for (std::size_t i = lag; i < result.size(); ++i) {
			next.push_back(result[i] - result[i - lag]);
		}
		result = std::move(next);
	}
	return result;
}

std::vector<double> Sarima::multiplyPolynomials(const std::vector<double> &lhs, const std::vector<double> &rhs) {
	if (lhs.empty() || rhs.empty()) {
		return {};
	}
	std::vector<double> product(lhs.size() + rhs.size() - 1, 0.0);
	for (std::size_t i = 0; i < lhs.size(); ++i) {
		if (lhs[i] == 0.0) {
			continue;
		}
		for (std::size_t j = 0; j < rhs.size(); ++j) {
			product[i + j] += lhs[i] * rhs[j];
		}
	}
	return product;
}

double Sarima::normalQuantile(double p) {
	if (p <= 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}
	if (std::abs(p - 0.5) < 1e-10) {
		return 0.0;
	}

	// Acklam's rational approximation.
	static const double a[] = {-3.969683028665376e1, 2.209460984245205e2,  -2.759285104469687e2,
	                           1.38357751867269e2,   -3.066479806614716e1, 2.506628277459239};
	static const double b[] = {-5.447609879822406e1, 1.615858368580409e2, -1.556989798598866e2, 6.680131188771972e1,
	                           -1.328068155288572e1};
	static const double c[] = {-7.784894002430293e-3, -3.223964580411365e-1, -2.400758277161838,
	                           -2.549732539343734,    4.374664141464968,     2.938163982698783};
	static const double d[] = {7.784695709041462e-3, 3.224671290700398e-1, 2.445134137142996, 3.754408661907416};
	constexpr double p_low = 0.02425;
	constexpr double p_high = 1.0 - p_low;

	if (p < p_low) {
		const double q = std::sqrt(-2.0 * std::log(p));
		return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
		       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
	}
	if (p <= p_high) {
		const double q = p - 0.5;
		const double r = q * q;
		return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
		       (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
	}
	const double q = std::sqrt(-2.0 * std::log(1.0 - p));
	return -(((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
	       ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
}

std::size_t Sarima::minimumObservations() const {
	const int s = seasonal_period_ > 1 ? seasonal_period_ : 0;
	const std::size_t differencing_loss = static_cast<std::size_t>(d_ + D_ * s);
	const std::size_t ar_degree = static_cast<std::size_t>(p_ + P_ * s);
	const std::size_t ma_degree = static_cast<std::size_t>(q_ + Q_ * s);
	return differencing_loss + ar_degree + std::max(kMinResidualObservations, ma_degree + 1);
}

Sarima::Polynomials Sarima::buildPolynomials(const Eigen::VectorXd &params) const {
	const int s = seasonal_period_ > 1 ? seasonal_period_ : 0;
	Eigen::Index offset = 0;

	std::vector<double> ar(static_cast<std::size_t>(p_ + 1), 0.0);
	ar[0] = 1.0;
	for (int i = 0; i < p_; ++i) {
		ar[static_cast<std::size_t>(i + 1)] = -params[offset++];
	}
	std::vector<double> ma(static_cast<std::size_t>(q_ + 1), 0.0);
	ma[0] = 1.0;
	for (int i = 0; i < q_; ++i) {
		ma[static_cast<std::size_t>(i + 1)] = params[offset++];
	}
	std::vector<double> seasonal_ar(static_cast<std::size_t>(P_ * s + 1), 0.0);
	seasonal_ar[0] = 1.0;
	for (int i = 0; i < P_; ++i) {
		seasonal_ar[static_cast<std::size_t>((i + 1) * s)] = -params[offset++];
	}
	std::vector<double> seasonal_ma(static_cast<std::size_t>(Q_ * s + 1), 0.0);
	seasonal_ma[0] = 1.0;
	for (int i = 0; i < Q_; ++i) {
		seasonal_ma[static_cast<std::size_t>((i + 1) * s)] = params[offset++];
	}

	return Polynomials{multiplyPolynomials(ar, seasonal_ar), multiplyPolynomials(ma, seasonal_ma)};
}

double Sarima::conditionalSumOfSquares(const Eigen::VectorXd &params, std::vector<double> *residuals) const {
	const auto poly = buildPolynomials(params);
	const std::size_t n = differenced_.size();
	const std::size_t start = poly.ar.size() - 1;

	std::vector<double> errors(n, 0.0);
	double sum_sq = 0.0;
	std::size_t count = 0;
	for (std::size_t t = start; t < n; ++t) {
		double value = 0.0;
		for (std::size_t k = 0; k < poly.ar.size(); ++k) {
			value += poly.ar[k] * (differenced_[t - k] - mean_);
		}
		for (std::size_t k = 1; k < poly.ma.size() && k <= t; ++k) {
			value -= poly.ma[k] * errors[t - k];
		}
		errors[t] = value;
		sum_sq += value * value;
		++count;
	}

	if (residuals) {
		*residuals = std::move(errors);
	}
	return count > 0 ? sum_sq / static_cast<double>(count) : std::numeric_limits<double>::infinity();
}

void Sarima::fit(const core::WeeklySeries &series) {
	is_fitted_ = false;
	const auto &values = series.getValues();
	if (values.size() < minimumObservations()) {
		throw core::InsufficientHistoryError("Insufficient data for the given SARIMA order: " +
		                                     std::to_string(values.size()) + " weeks, need " +
		                                     std::to_string(minimumObservations()) + ".");
	}
	for (double value : values) {
		if (!std::isfinite(value)) {
			throw std::runtime_error("SARIMA input contains non-finite values.");
		}
	}

	history_ = values;
	differenced_ = seasonalDifference(difference(history_, d_), D_, seasonal_period_);
	const bool differenced = d_ > 0 || D_ > 0;
	mean_ = (include_mean_ && !differenced)
	            ? std::accumulate(differenced_.begin(), differenced_.end(), 0.0) / static_cast<double>(differenced_.size())
	            : 0.0;

	const int n_params = p_ + q_ + P_ + Q_;
	Eigen::VectorXd initial = Eigen::VectorXd::Zero(n_params);
	if (p_ > 0) {
		std::vector<double> centred = differenced_;
		for (double &value : centred) {
			value -= mean_;
		}
		initial.head(p_) = yuleWalker(centred, p_);
	}
	const Eigen::VectorXd lower = Eigen::VectorXd::Constant(n_params, -kCoefficientBound);
	const Eigen::VectorXd upper = Eigen::VectorXd::Constant(n_params, kCoefficientBound);

	utils::NelderMeadOptimizer::Options options;
	options.max_iterations = max_iterations_;
	const auto result = utils::NelderMeadOptimizer().minimize(
	    [this](const Eigen::VectorXd &params) { return conditionalSumOfSquares(params, nullptr); }, initial, options,
	    lower, upper);

	iterations_ = result.iterations;
	if (!std::isfinite(result.value)) {
		throw std::runtime_error("SARIMA objective is not finite at the optimum.");
	}
	if (!result.converged) {
		throw core::ConvergenceError("SARIMA fit did not converge within " + std::to_string(max_iterations_) +
		                             " iterations.");
	}

	Eigen::Index offset = 0;
	ar_coeffs_ = result.best.segment(offset, p_);
	offset += p_;
	ma_coeffs_ = result.best.segment(offset, q_);
	offset += q_;
	seasonal_ar_coeffs_ = result.best.segment(offset, P_);
	offset += P_;
	seasonal_ma_coeffs_ = result.best.segment(offset, Q_);

	std::vector<double> differenced_residuals;
	sigma2_ = conditionalSumOfSquares(result.best, &differenced_residuals);

	// Residuals are re-aligned to the undifferenced history; the observations
	// consumed by differencing carry zero innovations.
	const std::size_t lost = history_.size() - differenced_.size();
	residuals_.assign(lost, 0.0);
	residuals_.insert(residuals_.end(), differenced_residuals.begin(), differenced_residuals.end());

	const auto poly = buildPolynomials(result.best);
	std::vector<double> full_ar = poly.ar;
	for (int i = 0; i < d_; ++i) {
		full_ar = multiplyPolynomials(full_ar, {1.0, -1.0});
	}
	if (seasonal_period_ > 1) {
		std::vector<double> seasonal_diff(static_cast<std::size_t>(seasonal_period_ + 1), 0.0);
		seasonal_diff.front() = 1.0;
		seasonal_diff.back() = -1.0;
		for (int i = 0; i < D_; ++i) {
			full_ar = multiplyPolynomials(full_ar, seasonal_diff);
		}
	}
	full_ar_ = std::move(full_ar);
	ma_poly_ = poly.ma;

	const std::size_t effective = differenced_.size() - (poly.ar.size() - 1);
	if (sigma2_ > 0.0 && effective > 0) {
		const double loglik = -0.5 * static_cast<double>(effective) * (std::log(2.0 * kPi * sigma2_) + 1.0);
		aic_ = -2.0 * loglik + 2.0 * static_cast<double>(n_params + (mean_ != 0.0 ? 1 : 0));
	} else {
		aic_.reset();
	}

	is_fitted_ = true;

	if (seasonal_period_ > 1 && (P_ > 0 || D_ > 0 || Q_ > 0)) {
		BOMCAST_DEBUG("SARIMA({},{},{})({},{},{})[{}] fitted on '{}' in {} iterations.", p_, d_, q_, P_, D_, Q_,
		              seasonal_period_, series.label(), iterations_);
	} else {
		BOMCAST_DEBUG("ARIMA({},{},{}) fitted on '{}' in {} iterations.", p_, d_, q_, series.label(), iterations_);
	}
	if (p_ > 0) {
		BOMCAST_TRACE("Non-seasonal AR coeffs: [{}]", formatCoefficients(ar_coeffs_));
	}
	if (q_ > 0) {
		BOMCAST_TRACE("Non-seasonal MA coeffs: [{}]", formatCoefficients(ma_coeffs_));
	}
	if (P_ > 0) {
		BOMCAST_TRACE("Seasonal AR coeffs: [{}]", formatCoefficients(seasonal_ar_coeffs_));
	}
	if (Q_ > 0) {
		BOMCAST_TRACE("Seasonal MA coeffs: [{}]", formatCoefficients(seasonal_ma_coeffs_));
	}
}

core::Forecast Sarima::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}

	std::vector<double> path = history_;
	for (double &value : path) {
		value -= mean_;
	}
	std::vector<double> errors = residuals_;

	core::Forecast forecast;
	forecast.point.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		const std::size_t len = path.size();
		double next = 0.0;
		for (std::size_t k = 1; k < full_ar_.size() && k <= len; ++k) {
			next -= full_ar_[k] * path[len - k];
		}
		for (std::size_t k = 1; k < ma_poly_.size() && k <= len; ++k) {
			next += ma_poly_[k] * errors[len - k];
		}
		if (!std::isfinite(next)) {
			throw std::runtime_error("SARIMA forecast diverged.");
		}
		path.push_back(next);
		errors.push_back(0.0);
		forecast.point.push_back(next + mean_);
	}
	return forecast;
}

std::vector<double> Sarima::psiWeights(int horizon) const {
	std::vector<double> psi(static_cast<std::size_t>(std::max(horizon, 1)), 0.0);
	psi[0] = 1.0;
	for (std::size_t j = 1; j < psi.size(); ++j) {
		double value = j < ma_poly_.size() ? ma_poly_[j] : 0.0;
		for (std::size_t k = 1; k <= j && k < full_ar_.size(); ++k) {
			value -= full_ar_[k] * psi[j - k];
		}
		psi[j] = value;
	}
	return psi;
}

core::Forecast Sarima::predictWithConfidence(int horizon, double confidence) {
	if (confidence <= 0.0 || confidence >= 1.0) {
		throw std::invalid_argument("Confidence level must be between 0 and 1.");
	}

	core::Forecast forecast = predict(horizon);
	if (forecast.empty()) {
		return forecast;
	}

	const double z_score = normalQuantile(1.0 - (1.0 - confidence) / 2.0);
	const auto psi = psiWeights(horizon);

	std::vector<double> lower;
	std::vector<double> upper;
	lower.reserve(forecast.point.size());
	upper.reserve(forecast.point.size());
	double cumulative = 0.0;
	for (std::size_t h = 0; h < forecast.point.size(); ++h) {
		cumulative += psi[h] * psi[h];
		const double scale = std::sqrt(std::max(sigma2_, 0.0) * cumulative);
		lower.push_back(forecast.point[h] - z_score * scale);
		upper.push_back(forecast.point[h] + z_score * scale);
	}
	forecast.setInterval(std::move(lower), std::move(upper));
	return forecast;
}

SarimaBuilder &SarimaBuilder::withAR(int p) {
	p_ = p;
	return *this;
}

SarimaBuilder &SarimaBuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

SarimaBuilder &SarimaBuilder::withMA(int q) {
	q_ = q;
	return *this;
}

SarimaBuilder &SarimaBuilder::withSeasonalAR(int P) {
	P_ = P;
	return *this;
}

SarimaBuilder &SarimaBuilder::withSeasonalDifferencing(int D) {
	D_ = D;
	return *this;
}

SarimaBuilder &SarimaBuilder::withSeasonalMA(int Q) {
	Q_ = Q;
	return *this;
}

SarimaBuilder &SarimaBuilder::withSeasonalPeriod(int s) {
	s_ = s;
	return *this;
}

SarimaBuilder &SarimaBuilder::withMean(bool include_mean) {
	include_mean_ = include_mean;
	return *this;
}

SarimaBuilder &SarimaBuilder::withMaxIterations(int max_iterations) {
	max_iterations_ = max_iterations;
	return *this;
}

std::unique_ptr<Sarima> SarimaBuilder::build() {
	return std::unique_ptr<Sarima>(new Sarima(p_, d_, q_, P_, D_, Q_, s_, include_mean_, max_iterations_));
}

} // namespace bomcast::models
