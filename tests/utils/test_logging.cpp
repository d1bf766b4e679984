#include <catch2/catch_test_macros.hpp>

#include "bomcast/utils/logging.hpp"

#ifndef BOMCAST_NO_LOGGING

using bomcast::utils::Logging;

TEST_CASE("Log level names parse case-insensitively", "[utils][logging]") {
	spdlog::level::level_enum level = spdlog::level::info;

	REQUIRE(Logging::parseLevel("debug", level));
	REQUIRE(level == spdlog::level::debug);
	REQUIRE(Logging::parseLevel("WARNING", level));
	REQUIRE(level == spdlog::level::warn);
	REQUIRE(Logging::parseLevel("Error", level));
	REQUIRE(level == spdlog::level::err);
	REQUIRE(Logging::parseLevel("off", level));
	REQUIRE(level == spdlog::level::off);

	level = spdlog::level::info;
	REQUIRE_FALSE(Logging::parseLevel("loud", level));
	REQUIRE(level == spdlog::level::info);
}

TEST_CASE("Shared logger is created once and honours init", "[utils][logging]") {
	auto &logger = Logging::getLogger();
	REQUIRE(logger != nullptr);
	REQUIRE(logger->name() == Logging::kLoggerName);
	REQUIRE(Logging::getLogger().get() == logger.get());

	Logging::init(spdlog::level::warn);
	REQUIRE(logger->level() == spdlog::level::warn);
	REQUIRE_NOTHROW(BOMCAST_WARN("logging test {}", 1));
	Logging::init(spdlog::level::info);
	REQUIRE(logger->level() == spdlog::level::info);
}

#endif // BOMCAST_NO_LOGGING
