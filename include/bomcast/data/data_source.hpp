#pragma once

#include "bomcast/data/planning_inputs.hpp"

#include <stdexcept>
#include <string>

namespace bomcast::data {

/// The data layer could not produce a required table; the run must abort.
class UpstreamDataError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @class IDataSource
 * @brief Supplies the tables of one planning run.
 */
class IDataSource {
public:
	virtual ~IDataSource() = default;

	/// @throws UpstreamDataError When a required table is unavailable.
	virtual PlanningInputs load() = 0;

	virtual std::string describe() const = 0;
};

/// Serves tables prepared in memory.
class InMemoryDataSource final : public IDataSource {
public:
	explicit InMemoryDataSource(PlanningInputs inputs) : inputs_(std::move(inputs)) {
	}

	PlanningInputs load() override {
		return inputs_;
	}

	std::string describe() const override {
		return "in-memory";
	}

private:
	PlanningInputs inputs_;
};

} // namespace bomcast::data
