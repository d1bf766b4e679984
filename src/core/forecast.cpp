#include "bomcast/core/forecast.hpp"

#include <cmath>

namespace bomcast::core {

const char *toString(ForecastMethod method) {
	switch (method) {
	case ForecastMethod::Seasonal:
		return "seasonal";
	case ForecastMethod::Tree:
		return "tree";
	case ForecastMethod::Ensemble:
		return "ensemble";
	case ForecastMethod::AverageFallback:
		return "average-fallback";
	}
	return "unknown";
}

ForecastMethod parseForecastMethod(const std::string &tag) {
	if (tag == "seasonal") {
		return ForecastMethod::Seasonal;
	}
	if (tag == "tree") {
		return ForecastMethod::Tree;
	}
	if (tag == "ensemble") {
		return ForecastMethod::Ensemble;
	}
	if (tag == "average-fallback") {
		return ForecastMethod::AverageFallback;
	}
	throw std::invalid_argument("Unknown forecast method tag '" + tag + "'.");
}

double roundTo(double value, int digits) {
	const double scale = std::pow(10.0, digits);
	return std::round(value * scale) / scale;
}

double roundToTenth(double value) {
	return roundTo(value, 1);
}

} // namespace bomcast::core
