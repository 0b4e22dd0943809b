#pragma once

#include "spme/core/ids.h"
#include "spme/domain/money.h"

#include <cstddef>
#include <string>
#include <vector>

namespace spme::domain {

struct RankedMember {
  std::size_t rank{0};  // 1-based; 1 is the cheapest source
  core::ProductId product_id;
  core::SupplierId supplier_id;
  std::string name;
  std::string url;
  Money price;
};

// PriceComparison is the per-group report handed to purchasing.
// Members are ranked by ascending price, ties by supplier id then product id.
struct PriceComparison {
  core::GroupId group_id;
  double savings_absolute{0.0};
  double savings_percent{0.0};  // 0 when max price is 0
  std::vector<RankedMember> ranked_members;
};

}  // namespace spme::domain
