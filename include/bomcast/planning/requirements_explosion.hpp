#pragma once

#include "bomcast/core/forecast.hpp"
#include "bomcast/planning/bom.hpp"
#include "bomcast/planning/material_demand.hpp"

#include <string>

namespace bomcast::planning {

/// Forecast units of one product over the planning horizon.
struct ProductDemand {
	std::string product;
	double units = 0.0;
	core::ForecastMethod method = core::ForecastMethod::AverageFallback;
};

/// Forecast consumption of one fabric colour over the planning horizon.
struct FabricDemand {
	std::string code;
	FabricInfo fabric;
	double quantity = 0.0;
	core::ForecastMethod method = core::ForecastMethod::AverageFallback;
};

struct ExplosionStats {
	std::size_t products_allocated = 0;
	std::size_t paths_visited = 0;
	/// (variation, size) paths with a positive share but no BOM line.
	std::size_t missing_paths = 0;
	std::size_t lines_applied = 0;
	std::size_t direct_entries = 0;
};

/**
 * @class RequirementsExplosion
 * @brief Turns unit or fabric forecasts into fabric-colour requirements.
 *
 * Allocation mode splits a product's units across variation and size shares
 * and walks the BOM lines of every (variation, size) path, adding
 * units * qty_per_unit * (1 + wastage / 100). Direct mode adds a fabric
 * colour forecast as-is. Both add into the same MaterialDemand, so totals do
 * not depend on the order contributions arrive in.
 */
class RequirementsExplosion {
public:
	RequirementsExplosion(const BomTable &bom, double default_wastage_percent);

	void allocate(const ProductDemand &demand, const BomProportion &variations, const BomProportion &sizes,
	              MaterialDemand &target);

	void addDirect(const FabricDemand &demand, MaterialDemand &target);

	const ExplosionStats &stats() const {
		return stats_;
	}

private:
	const BomTable &bom_;
	double default_wastage_percent_;
	ExplosionStats stats_;
};

} // namespace bomcast::planning
