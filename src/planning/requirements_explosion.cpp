#include "bomcast/planning/requirements_explosion.hpp"

#include "bomcast/utils/logging.hpp"

#include <stdexcept>

namespace bomcast::planning {

RequirementsExplosion::RequirementsExplosion(const BomTable &bom, double default_wastage_percent)
    : bom_(bom), default_wastage_percent_(default_wastage_percent) {
	if (default_wastage_percent < 0.0) {
		throw std::invalid_argument("Default wastage must be non-negative.");
	}
}

void RequirementsExplosion::allocate(const ProductDemand &demand, const BomProportion &variations,
                                     const BomProportion &sizes, MaterialDemand &target) {
	if (variations.empty() || sizes.empty() || demand.units <= 0.0) {
		return;
	}
	++stats_.products_allocated;

	for (const auto &variation : variations.entries()) {
		const double variation_units = demand.units * variation.share;
		for (const auto &size : sizes.entries()) {
			const double units = variation_units * size.share;
			if (units <= 0.0) {
				continue;
			}
			++stats_.paths_visited;

			const auto lines = bom_.lookup(variation.key, size.key);
			if (lines.empty()) {
				++stats_.missing_paths;
				BOMCAST_DEBUG("No BOM for '{}' variation '{}' size '{}'.", demand.product, variation.key, size.key);
				continue;
			}
			for (const BomLine *line : lines) {
				target.add(line->fabric_colour_code, line->fabric,
				           units * line->consumptionPerUnit(default_wastage_percent_), demand.method);
				++stats_.lines_applied;
			}
		}
	}
}

void RequirementsExplosion::addDirect(const FabricDemand &demand, MaterialDemand &target) {
	target.add(demand.code, demand.fabric, demand.quantity, demand.method);
	++stats_.direct_entries;
}

} // namespace bomcast::planning
