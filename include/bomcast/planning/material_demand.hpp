#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/planning/bom.hpp"

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace bomcast::planning {

/**
 * @struct MaterialEntry
 * @brief Accumulated requirement for one fabric colour.
 *
 * Metadata comes from the first contribution; quantities from every
 * contribution are summed, overall and per forecast method.
 */
struct MaterialEntry {
	std::string code;
	FabricInfo fabric;
	double required_qty = 0.0;
	std::array<double, 4> qty_by_method{};

	/// The method that contributed the largest quantity.
	core::ForecastMethod dominantMethod() const;
};

/**
 * @class MaterialDemand
 * @brief Additive fabric-colour requirement aggregate.
 *
 * Entries iterate in first-contribution order. The aggregate is built by
 * repeated add() calls and then frozen; further additions throw
 * std::logic_error.
 */
class MaterialDemand {
public:
	void add(const std::string &code, const FabricInfo &fabric, double quantity, core::ForecastMethod method);

	/// Adds every entry of @p other.
	void merge(const MaterialDemand &other);

	void freeze() {
		frozen_ = true;
	}
	bool frozen() const {
		return frozen_;
	}

	const MaterialEntry *find(const std::string &code) const;

	const std::vector<MaterialEntry> &entries() const {
		return entries_;
	}
	std::size_t size() const {
		return entries_.size();
	}
	bool empty() const {
		return entries_.empty();
	}
	double totalRequired() const;

private:
	std::vector<MaterialEntry> entries_;
	std::unordered_map<std::string, std::size_t> index_;
	bool frozen_ = false;
};

} // namespace bomcast::planning
