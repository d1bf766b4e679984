#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bomcast::planning {

/// Descriptive and cost attributes of one fabric colour.
struct FabricInfo {
	std::string fabric_name;
	std::string unit;
	std::string colour_name;
	double cost_per_unit = 0.0;
};

/**
 * @struct BomLine
 * @brief Material consumed by one unit of a (variation, size) configuration.
 */
struct BomLine {
	std::string product;
	std::string variation;
	std::string size;
	std::string fabric_colour_code;
	FabricInfo fabric;
	double qty_per_unit = 0.0;
	std::optional<double> wastage_percent;

	/// The line's wastage, or @p default_percent when unset or non-positive.
	double effectiveWastage(double default_percent) const;

	/// qty_per_unit including wastage.
	double consumptionPerUnit(double default_percent) const;
};

/**
 * @class BomProportion
 * @brief Normalised shares of a product's historical units per key.
 *
 * Keys with non-positive units are excluded; a table with no positive units
 * is empty. Entries keep the order they were supplied in.
 */
class BomProportion {
public:
	struct Entry {
		std::string key;
		std::string label;
		double units = 0.0;
		double share = 0.0;
	};

	struct Observation {
		std::string key;
		std::string label;
		double units = 0.0;
	};

	BomProportion() = default;

	/// Units for a repeated key are summed.
	static BomProportion fromUnits(const std::vector<Observation> &observations);

	bool empty() const {
		return entries_.empty();
	}
	std::size_t size() const {
		return entries_.size();
	}
	double totalUnits() const {
		return total_;
	}
	const std::vector<Entry> &entries() const {
		return entries_;
	}

	/// Share of @p key, 0 when absent.
	double share(const std::string &key) const;

private:
	std::vector<Entry> entries_;
	double total_ = 0.0;
};

/**
 * @class BomTable
 * @brief BOM lines indexed by (variation, size).
 */
class BomTable {
public:
	BomTable() = default;
	explicit BomTable(std::vector<BomLine> lines);

	/// Lines for one configuration; empty when the configuration has no BOM.
	std::vector<const BomLine *> lookup(const std::string &variation, const std::string &size) const;

	bool hasProduct(const std::string &product) const;

	/// Metadata of the first line using @p code.
	std::optional<FabricInfo> fabricInfo(const std::string &code) const;

	std::size_t size() const {
		return lines_.size();
	}
	const std::vector<BomLine> &lines() const {
		return lines_;
	}

private:
	std::vector<BomLine> lines_;
	std::map<std::pair<std::string, std::string>, std::vector<std::size_t>> index_;
	std::unordered_map<std::string, std::size_t> first_by_code_;
	std::unordered_map<std::string, std::size_t> product_lines_;
};

} // namespace bomcast::planning
