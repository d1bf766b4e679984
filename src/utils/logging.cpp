#include "bomcast/utils/logging.hpp"

#ifndef BOMCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace bomcast::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get(kLoggerName);
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt(kLoggerName);
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

bool Logging::parseLevel(const std::string &name, spdlog::level::level_enum &level) {
	std::string lowered = name;
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "warning") {
		lowered = "warn";
	} else if (lowered == "error") {
		lowered = "err";
	}

	const auto parsed = spdlog::level::from_str(lowered);
	// from_str maps unknown names to off; only accept off when asked for explicitly.
	if (parsed == spdlog::level::off && lowered != "off") {
		return false;
	}
	level = parsed;
	return true;
}

bool Logging::initFromEnvironment() {
	const char *raw = std::getenv(kLevelVariable);
	if (raw == nullptr || *raw == '\0') {
		return false;
	}

	spdlog::level::level_enum level = spdlog::level::info;
	if (!parseLevel(raw, level)) {
		getLogger()->warn("Ignoring unrecognised {} value '{}'.", kLevelVariable, raw);
		return false;
	}
	init(level);
	return true;
}

} // namespace bomcast::utils

#endif // BOMCAST_NO_LOGGING
