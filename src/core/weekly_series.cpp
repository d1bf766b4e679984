#include "bomcast/core/weekly_series.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace bomcast::core {

WeeklySeries::WeeklySeries(std::vector<TimePoint> weeks, std::vector<Value> values, std::string label)
    : weeks_(std::move(weeks)), values_(std::move(values)), label_(std::move(label)) {
	if (weeks_.size() != values_.size()) {
		throw std::invalid_argument("WeeklySeries weeks and values must have the same size.");
	}
	validate();
}

void WeeklySeries::validate() const {
	for (std::size_t i = 0; i < weeks_.size(); ++i) {
		if (calendar::weekday(weeks_[i]) != 0) {
			throw std::invalid_argument("WeeklySeries timestamps must be Monday week starts.");
		}
		if (i > 0 && calendar::dayIndex(weeks_[i]) - calendar::dayIndex(weeks_[i - 1]) != calendar::kDaysPerWeek) {
			throw std::invalid_argument("WeeklySeries weeks must be strictly increasing on a 7-day stride.");
		}
	}
}

WeeklySeries WeeklySeries::fromObservations(std::vector<Observation> observations, GapFill fill, std::string label) {
	if (observations.empty()) {
		return WeeklySeries({}, {}, std::move(label));
	}

	std::map<std::int64_t, Value> by_week;
	for (const auto &obs : observations) {
		by_week[calendar::dayIndex(calendar::weekStart(obs.week))] += obs.value;
	}

	const std::int64_t first = by_week.begin()->first;
	const std::int64_t last = by_week.rbegin()->first;
	const auto count = static_cast<std::size_t>((last - first) / calendar::kDaysPerWeek + 1);

	std::vector<TimePoint> weeks;
	std::vector<Value> values;
	weeks.reserve(count);
	values.reserve(count);

	Value previous = 0.0;
	for (std::int64_t day = first; day <= last; day += calendar::kDaysPerWeek) {
		const auto it = by_week.find(day);
		Value value;
		if (it != by_week.end()) {
			value = it->second;
		} else {
			value = (fill == GapFill::ForwardFill) ? previous : 0.0;
		}
		weeks.push_back(calendar::fromDayIndex(day));
		values.push_back(value);
		previous = value;
	}

	return WeeklySeries(std::move(weeks), std::move(values), std::move(label));
}

WeeklySeries::TimePoint WeeklySeries::firstWeek() const {
	if (weeks_.empty()) {
		throw std::out_of_range("WeeklySeries is empty.");
	}
	return weeks_.front();
}

WeeklySeries::TimePoint WeeklySeries::lastWeek() const {
	if (weeks_.empty()) {
		throw std::out_of_range("WeeklySeries is empty.");
	}
	return weeks_.back();
}

std::optional<std::size_t> WeeklySeries::indexOf(const TimePoint &week) const {
	if (weeks_.empty()) {
		return std::nullopt;
	}
	const auto offset = calendar::dayIndex(week) - calendar::dayIndex(weeks_.front());
	if (offset < 0 || offset % calendar::kDaysPerWeek != 0) {
		return std::nullopt;
	}
	const auto index = static_cast<std::size_t>(offset / calendar::kDaysPerWeek);
	if (index >= weeks_.size()) {
		return std::nullopt;
	}
	return index;
}

WeeklySeries WeeklySeries::slice(std::size_t start, std::size_t end) const {
	if (start > end || end > size()) {
		throw std::out_of_range("Invalid WeeklySeries slice bounds.");
	}
	return WeeklySeries(std::vector<TimePoint>(weeks_.begin() + start, weeks_.begin() + end),
	                    std::vector<Value>(values_.begin() + start, values_.begin() + end), label_);
}

WeeklySeries WeeklySeries::tail(std::size_t count) const {
	const std::size_t n = std::min(count, size());
	return slice(size() - n, size());
}

WeeklySeries WeeklySeries::extendedTo(const TimePoint &until) const {
	if (weeks_.empty()) {
		return *this;
	}
	const auto target = calendar::weekStart(until);
	if (target <= weeks_.back()) {
		return *this;
	}
	auto weeks = weeks_;
	auto values = values_;
	for (auto week = calendar::addWeeks(weeks_.back(), 1); week <= target; week = calendar::addWeeks(week, 1)) {
		weeks.push_back(week);
		values.push_back(0.0);
	}
	return WeeklySeries(std::move(weeks), std::move(values), label_);
}

} // namespace bomcast::core
