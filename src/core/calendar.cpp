#include "bomcast/core/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace bomcast::core::calendar {

namespace {

// Howard Hinnant's civil calendar algorithms (proleptic Gregorian).
constexpr std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
	return (a >= 0) ? a / b : -((-a + b - 1) / b);
}

bool isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
	static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return days[month - 1];
}

int parseDigits(const std::string &text, std::size_t pos, std::size_t count) {
	int value = 0;
	for (std::size_t i = pos; i < pos + count; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw std::invalid_argument("Invalid ISO date '" + text + "'.");
		}
		value = value * 10 + (text[i] - '0');
	}
	return value;
}

} // namespace

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = floorDiv(y, 400);
	const std::int64_t yoe = y - era * 400;
	const std::int64_t mp = (static_cast<std::int64_t>(month) + 9) % 12;
	const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(day) - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
	const std::int64_t z = days + 719468;
	const std::int64_t era = floorDiv(z, 146097);
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
	const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
	const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
	return CivilDate{static_cast<int>(y), static_cast<unsigned>(m), static_cast<unsigned>(d)};
}

std::int64_t dayIndex(const TimePoint &tp) {
	const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	return floorDiv(seconds, kSecondsPerDay);
}

TimePoint fromDayIndex(std::int64_t days) {
	return TimePoint{} + std::chrono::seconds(days * kSecondsPerDay);
}

TimePoint fromCivil(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Calendar date out of range.");
	}
	return fromDayIndex(daysFromCivil(year, month, day));
}

CivilDate toCivil(const TimePoint &tp) {
	return civilFromDays(dayIndex(tp));
}

TimePoint parseIsoDate(const std::string &text) {
	if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
		throw std::invalid_argument("Invalid ISO date '" + text + "'.");
	}
	if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
		throw std::invalid_argument("Invalid ISO date '" + text + "'.");
	}
	const int year = parseDigits(text, 0, 4);
	const int month_value = parseDigits(text, 5, 2);
	const int day_value = parseDigits(text, 8, 2);
	if (month_value < 1 || month_value > 12 || day_value < 1 ||
	    static_cast<unsigned>(day_value) > daysInMonth(year, static_cast<unsigned>(month_value))) {
		throw std::invalid_argument("Invalid ISO date '" + text + "'.");
	}
	return fromCivil(year, static_cast<unsigned>(month_value), static_cast<unsigned>(day_value));
}

std::string formatIsoDate(const TimePoint &tp) {
	const auto date = toCivil(tp);
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
	return buffer;
}

int weekday(const TimePoint &tp) {
	// 1970-01-01 was a Thursday (index 3 with Monday = 0).
	const std::int64_t wd = (dayIndex(tp) + 3) % kDaysPerWeek;
	return static_cast<int>(wd < 0 ? wd + kDaysPerWeek : wd);
}

TimePoint weekStart(const TimePoint &tp) {
	return fromDayIndex(dayIndex(tp) - weekday(tp));
}

TimePoint addWeeks(const TimePoint &tp, int weeks) {
	return tp + std::chrono::seconds(static_cast<std::int64_t>(weeks) * kDaysPerWeek * kSecondsPerDay);
}

std::int64_t weeksBetween(const TimePoint &from, const TimePoint &to) {
	return floorDiv(dayIndex(to) - dayIndex(from), kDaysPerWeek);
}

int isoWeekOfYear(const TimePoint &tp) {
	const std::int64_t days = dayIndex(tp);
	const std::int64_t thursday = days - weekday(tp) + 3;
	const int iso_year = civilFromDays(thursday).year;
	const std::int64_t jan1 = daysFromCivil(iso_year, 1, 1);
	return static_cast<int>((thursday - jan1) / kDaysPerWeek) + 1;
}

int month(const TimePoint &tp) {
	return static_cast<int>(toCivil(tp).month);
}

int quarter(const TimePoint &tp) {
	return (month(tp) - 1) / 3 + 1;
}

} // namespace bomcast::core::calendar
