#include "bomcast/forecasting/seasonal_adapter.hpp"

#include "bomcast/models/sarima.hpp"
#include "bomcast/utils/logging.hpp"

#include <stdexcept>

namespace bomcast::forecasting {

SeasonalSpec SeasonalSpec::productDefault() {
	SeasonalSpec spec;
	spec.P = 1;
	spec.D = 1;
	spec.Q = 0;
	spec.s = 52;
	return spec;
}

SeasonalSpec SeasonalSpec::fabricDefault() {
	return SeasonalSpec{};
}

void SeasonalSpec::validate() const {
	if (p < 0 || d < 0 || q < 0 || P < 0 || D < 0 || Q < 0) {
		throw std::invalid_argument("Seasonal model orders must be non-negative.");
	}
	if ((P > 0 || D > 0 || Q > 0) && s < 2) {
		throw std::invalid_argument("Seasonal terms require a period of at least 2.");
	}
	if (max_iterations <= 0) {
		throw std::invalid_argument("Seasonal model iteration cap must be positive.");
	}
	if (confidence <= 0.0 || confidence >= 1.0) {
		throw std::invalid_argument("Seasonal interval confidence must be in (0, 1).");
	}
}

SeasonalAdapter::SeasonalAdapter(SeasonalSpec spec) : spec_(spec) {
	spec_.validate();
}

core::ModelResult<core::Forecast> SeasonalAdapter::forecast(const core::WeeklySeries &series, int steps) const {
	using Result = core::ModelResult<core::Forecast>;
	if (steps <= 0) {
		return Result::available(core::Forecast{});
	}

	try {
		auto model = models::SarimaBuilder()
		                 .withAR(spec_.p)
		                 .withDifferencing(spec_.d)
		                 .withMA(spec_.q)
		                 .withSeasonalAR(spec_.P)
		                 .withSeasonalDifferencing(spec_.D)
		                 .withSeasonalMA(spec_.Q)
		                 .withSeasonalPeriod(spec_.s)
		                 .withMaxIterations(spec_.max_iterations)
		                 .build();
		model->fit(series);
		return Result::available(model->predictWithConfidence(steps, spec_.confidence));
	} catch (const core::InsufficientHistoryError &e) {
		BOMCAST_DEBUG("Seasonal model unavailable for '{}': {}", series.label(), e.what());
		return Result::unavailable(core::UnavailableReason::InsufficientHistory, e.what());
	} catch (const core::ConvergenceError &e) {
		BOMCAST_DEBUG("Seasonal model unavailable for '{}': {}", series.label(), e.what());
		return Result::unavailable(core::UnavailableReason::NonConvergence, e.what());
	} catch (const std::exception &e) {
		BOMCAST_DEBUG("Seasonal model failed for '{}': {}", series.label(), e.what());
		return Result::unavailable(core::UnavailableReason::NumericalFailure, e.what());
	}
}

} // namespace bomcast::forecasting
