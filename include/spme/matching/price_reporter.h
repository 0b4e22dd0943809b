#pragma once

#include "spme/core/ids.h"
#include "spme/domain/price_comparison.h"
#include "spme/domain/raw_product.h"

#include <vector>

namespace spme::matching {

// cheaper_source orders listings for purchasing: ascending price, then
// supplier id, then product id (all lexicographic).
[[nodiscard]] bool cheaper_source(const domain::RawProduct& a, const domain::RawProduct& b);

// compare_prices ranks a group's members and computes the savings of buying
// from the cheapest source instead of the most expensive one:
//   savings_absolute = max - min
//   savings_percent  = savings_absolute / max * 100, or 0 when max == 0
// members are the group's listings in any order; none may be null.
[[nodiscard]] domain::PriceComparison compare_prices(
    const core::GroupId& group_id, std::vector<const domain::RawProduct*> members);

}  // namespace spme::matching
