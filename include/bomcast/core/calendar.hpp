#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace bomcast::core {

/**
 * @brief Calendar helpers for weekly planning data.
 *
 * All time points are interpreted as UTC midnights. Weeks start on Monday,
 * matching the upstream `date_trunc('week', ...)` bucketing.
 */
namespace calendar {

using TimePoint = std::chrono::system_clock::time_point;

constexpr std::int64_t kSecondsPerDay = 86400;
constexpr int kDaysPerWeek = 7;

struct CivilDate {
	int year = 1970;
	unsigned month = 1;
	unsigned day = 1;
};

std::int64_t daysFromCivil(int year, unsigned month, unsigned day);
CivilDate civilFromDays(std::int64_t days);

/// Day index (days since 1970-01-01), rounding towards negative infinity.
std::int64_t dayIndex(const TimePoint &tp);
TimePoint fromDayIndex(std::int64_t days);

TimePoint fromCivil(int year, unsigned month, unsigned day);
CivilDate toCivil(const TimePoint &tp);

/**
 * @brief Parses "YYYY-MM-DD" (an optional time suffix after 'T' or ' ' is ignored).
 * @throws std::invalid_argument when the text is not a valid calendar date.
 */
TimePoint parseIsoDate(const std::string &text);
std::string formatIsoDate(const TimePoint &tp);

/// Monday = 0 ... Sunday = 6.
int weekday(const TimePoint &tp);

/// Monday of the week containing @p tp.
TimePoint weekStart(const TimePoint &tp);
TimePoint addWeeks(const TimePoint &tp, int weeks);

/// Whole weeks from @p from to @p to (negative when @p to is earlier).
std::int64_t weeksBetween(const TimePoint &from, const TimePoint &to);

/// ISO-8601 week number (1..53).
int isoWeekOfYear(const TimePoint &tp);
int month(const TimePoint &tp);
int quarter(const TimePoint &tp);

} // namespace calendar

} // namespace bomcast::core
