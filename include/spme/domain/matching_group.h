#pragma once

#include "spme/core/ids.h"
#include "spme/domain/price_comparison.h"
#include "spme/domain/warning.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spme::domain {

enum class GroupStatus {
  kUnmatched,    // singleton: nothing matched this product
  kAutoMatched,  // confidence at or above the auto-confirm threshold
  kNeedsReview,  // matched, but direct evidence is weak
};

// MatchingGroup is a cluster of listings believed to be the same physical product.
// Groups are rebuilt from scratch on every run; group_id is stable only for
// identical input (numbered by the input position of each group's first member).
struct MatchingGroup {
  core::GroupId group_id;
  std::vector<core::ProductId> members;  // input order, size >= 1
  std::string representative_name;       // original (non-normalized) name
  core::ProductId representative_product_id;
  double min_price{0.0};
  double max_price{0.0};
  double avg_price{0.0};
  std::string currency;  // empty when members disagree
  core::ProductId best_member_id;
  core::SupplierId best_supplier_id;
  double confidence_score{1.0};
  std::size_t scored_pair_count{0};  // directly scored pairs inside the group
  GroupStatus status{GroupStatus::kUnmatched};
  std::vector<DataQualityWarning> warnings;
  PriceComparison comparison;
};

[[nodiscard]] std::string_view group_status_to_string(GroupStatus status);
[[nodiscard]] std::optional<GroupStatus> group_status_from_string(std::string_view value);

}  // namespace spme::domain
