#include "bomcast/planning/bom.hpp"

#include <stdexcept>

namespace bomcast::planning {

double BomLine::effectiveWastage(double default_percent) const {
	if (wastage_percent && *wastage_percent > 0.0) {
		return *wastage_percent;
	}
	return default_percent;
}

double BomLine::consumptionPerUnit(double default_percent) const {
	return qty_per_unit * (1.0 + effectiveWastage(default_percent) / 100.0);
}

BomProportion BomProportion::fromUnits(const std::vector<Observation> &observations) {
	BomProportion proportion;
	std::unordered_map<std::string, std::size_t> position;
	for (const auto &obs : observations) {
		auto it = position.find(obs.key);
		if (it == position.end()) {
			position.emplace(obs.key, proportion.entries_.size());
			proportion.entries_.push_back(Entry{obs.key, obs.label, obs.units, 0.0});
		} else {
			proportion.entries_[it->second].units += obs.units;
		}
	}

	std::vector<Entry> positive;
	for (auto &entry : proportion.entries_) {
		if (entry.units > 0.0) {
			proportion.total_ += entry.units;
			positive.push_back(std::move(entry));
		}
	}
	proportion.entries_ = std::move(positive);
	if (proportion.total_ <= 0.0) {
		proportion.entries_.clear();
		proportion.total_ = 0.0;
		return proportion;
	}
	for (auto &entry : proportion.entries_) {
		entry.share = entry.units / proportion.total_;
	}
	return proportion;
}

double BomProportion::share(const std::string &key) const {
	for (const auto &entry : entries_) {
		if (entry.key == key) {
			return entry.share;
		}
	}
	return 0.0;
}

BomTable::BomTable(std::vector<BomLine> lines) : lines_(std::move(lines)) {
	for (std::size_t i = 0; i < lines_.size(); ++i) {
		const auto &line = lines_[i];
		if (line.fabric_colour_code.empty()) {
			throw std::invalid_argument("BOM line for variation '" + line.variation + "' has no fabric colour code.");
		}
		if (line.qty_per_unit < 0.0) {
			throw std::invalid_argument("BOM line quantity must be non-negative.");
		}
		index_[{line.variation, line.size}].push_back(i);
		first_by_code_.emplace(line.fabric_colour_code, i);
		++product_lines_[line.product];
	}
}

std::vector<const BomLine *> BomTable::lookup(const std::string &variation, const std::string &size) const {
	std::vector<const BomLine *> found;
	auto it = index_.find({variation, size});
	if (it == index_.end()) {
		return found;
	}
	found.reserve(it->second.size());
	for (auto idx : it->second) {
		found.push_back(&lines_[idx]);
	}
	return found;
}

bool BomTable::hasProduct(const std::string &product) const {
	return product_lines_.count(product) > 0;
}

std::optional<FabricInfo> BomTable::fabricInfo(const std::string &code) const {
	auto it = first_by_code_.find(code);
	if (it == first_by_code_.end()) {
		return std::nullopt;
	}
	return lines_[it->second].fabric;
}

} // namespace bomcast::planning
