#pragma once

#ifndef BOMCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace bomcast::utils {

/**
 * @class Logging
 * @brief Process-wide spdlog logger shared by every pipeline stage.
 *
 * The logger is created lazily on first use. Its level can be set explicitly
 * with init() or taken from the BOMCAST_LOG_LEVEL environment variable.
 */
class Logging {
public:
	/// Name under which the logger is registered with spdlog.
	static constexpr const char *kLoggerName = "bomcast";

	/// Environment variable consulted by initFromEnvironment().
	static constexpr const char *kLevelVariable = "BOMCAST_LOG_LEVEL";

	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Sets the minimum level (and flush level) of the shared logger.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Applies BOMCAST_LOG_LEVEL when it is set.
	 * @return true when the variable was present and named a valid level.
	 */
	static bool initFromEnvironment();

	/// Parses a level name such as "debug" or "warn". Returns false for unknown names.
	static bool parseLevel(const std::string &name, spdlog::level::level_enum &level);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace bomcast::utils

#define BOMCAST_TRACE(...)    bomcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define BOMCAST_DEBUG(...)    bomcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define BOMCAST_INFO(...)     bomcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define BOMCAST_WARN(...)     bomcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define BOMCAST_ERROR(...)    bomcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define BOMCAST_CRITICAL(...) bomcast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace bomcast::utils {

class Logging {
public:
	static void init() {}
	static bool initFromEnvironment() {
		return false;
	}
};

} // namespace bomcast::utils

#define BOMCAST_TRACE(...)    do {} while(0)
#define BOMCAST_DEBUG(...)    do {} while(0)
#define BOMCAST_INFO(...)     do {} while(0)
#define BOMCAST_WARN(...)     do {} while(0)
#define BOMCAST_ERROR(...)    do {} while(0)
#define BOMCAST_CRITICAL(...) do {} while(0)

#endif // BOMCAST_NO_LOGGING
