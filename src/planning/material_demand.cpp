#include "bomcast/planning/material_demand.hpp"

#include <stdexcept>

namespace bomcast::planning {

core::ForecastMethod MaterialEntry::dominantMethod() const {
	std::size_t best = 0;
	for (std::size_t i = 1; i < qty_by_method.size(); ++i) {
		if (qty_by_method[i] > qty_by_method[best]) {
			best = i;
		}
	}
	return static_cast<core::ForecastMethod>(best);
}

void MaterialDemand::add(const std::string &code, const FabricInfo &fabric, double quantity,
                         core::ForecastMethod method) {
	if (frozen_) {
		throw std::logic_error("MaterialDemand is frozen; cannot add '" + code + "'.");
	}
	if (code.empty()) {
		throw std::invalid_argument("Fabric colour code must not be empty.");
	}

	auto it = index_.find(code);
	if (it == index_.end()) {
		it = index_.emplace(code, entries_.size()).first;
		MaterialEntry entry;
		entry.code = code;
		entry.fabric = fabric;
		entries_.push_back(std::move(entry));
	}
	auto &entry = entries_[it->second];
	entry.required_qty += quantity;
	entry.qty_by_method[static_cast<std::size_t>(method)] += quantity;
}

void MaterialDemand::merge(const MaterialDemand &other) {
	for (const auto &entry : other.entries_) {
		for (std::size_t m = 0; m < entry.qty_by_method.size(); ++m) {
			if (entry.qty_by_method[m] != 0.0) {
				add(entry.code, entry.fabric, entry.qty_by_method[m], static_cast<core::ForecastMethod>(m));
			}
		}
		if (!index_.count(entry.code)) {
			add(entry.code, entry.fabric, 0.0, entry.dominantMethod());
		}
	}
}

const MaterialEntry *MaterialDemand::find(const std::string &code) const {
	auto it = index_.find(code);
	return it == index_.end() ? nullptr : &entries_[it->second];
}

double MaterialDemand::totalRequired() const {
	double total = 0.0;
	for (const auto &entry : entries_) {
		total += entry.required_qty;
	}
	return total;
}

} // namespace bomcast::planning
