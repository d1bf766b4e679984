#include "bomcast/forecasting/tree_adapter.hpp"

#include "bomcast/utils/logging.hpp"

#include <stdexcept>

namespace bomcast::forecasting {

TreeAdapter::TreeAdapter(models::TreeConfig config) : config_(config) {
	config_.validate();
}

core::ModelResult<core::Forecast> TreeAdapter::forecast(const core::WeeklySeries &series, int steps) const {
	using Result = core::ModelResult<core::Forecast>;
	if (steps <= 0) {
		return Result::available(core::Forecast{});
	}

	try {
		models::TreeForecaster model(config_);
		model.fit(series);
		return Result::available(model.predict(steps));
	} catch (const core::InsufficientHistoryError &e) {
		BOMCAST_DEBUG("Tree model unavailable for '{}': {}", series.label(), e.what());
		return Result::unavailable(core::UnavailableReason::InsufficientHistory, e.what());
	} catch (const std::exception &e) {
		BOMCAST_DEBUG("Tree model failed for '{}': {}", series.label(), e.what());
		return Result::unavailable(core::UnavailableReason::NumericalFailure, e.what());
	}
}

} // namespace bomcast::forecasting
