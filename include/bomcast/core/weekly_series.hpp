#pragma once

#include "bomcast/core/calendar.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bomcast::core {

/**
 * @class WeeklySeries
 * @brief A scalar series with exactly one value per Monday-aligned week.
 *
 * Timestamps and values are stored in separate vectors. The constructor
 * enforces strictly increasing week starts on a 7-day stride, so every
 * consumer can rely on position i being exactly i weeks after the first week.
 */
class WeeklySeries {
public:
	using TimePoint = calendar::TimePoint;
	using Value = double;

	/// How weeks without an observation are filled when building from sparse data.
	enum class GapFill {
		ForwardFill,
		Zero
	};

	struct Observation {
		TimePoint week;
		Value value = 0.0;
	};

	WeeklySeries() = default;

	/**
	 * @brief Constructs a series from already-aligned weeks.
	 * @throws std::invalid_argument If sizes differ, a timestamp is not a Monday,
	 *         or the weeks are not strictly consecutive.
	 */
	WeeklySeries(std::vector<TimePoint> weeks, std::vector<Value> values, std::string label = {});

	/**
	 * @brief Builds a series from observations that may be unordered, share a
	 * week, or skip weeks.
	 *
	 * Observation dates are normalised to their week's Monday and values in the
	 * same week are summed. Missing weeks between the first and last observation
	 * are filled according to @p fill.
	 */
	static WeeklySeries fromObservations(std::vector<Observation> observations, GapFill fill = GapFill::ForwardFill,
	                                     std::string label = {});

	std::size_t size() const {
		return values_.size();
	}

	bool empty() const {
		return values_.empty();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return weeks_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const std::string &label() const {
		return label_;
	}

	TimePoint firstWeek() const;
	TimePoint lastWeek() const;

	/// Index of @p week in the series, or nullopt when it falls outside.
	std::optional<std::size_t> indexOf(const TimePoint &week) const;

	/// Half-open slice [start, end).
	WeeklySeries slice(std::size_t start, std::size_t end) const;

	/// Last @p count weeks (the whole series when shorter).
	WeeklySeries tail(std::size_t count) const;

	/**
	 * @brief Returns the series re-indexed onto [firstWeek(), @p until], filling
	 * weeks after the last observation with zero.
	 *
	 * Used to measure recent activity relative to a run-wide as-of week.
	 */
	WeeklySeries extendedTo(const TimePoint &until) const;

private:
	void validate() const;

	std::vector<TimePoint> weeks_;
	std::vector<Value> values_;
	std::string label_;
};

} // namespace bomcast::core
