#pragma once

#include "spme/domain/matching_group.h"
#include "spme/domain/pair_score.h"
#include "spme/domain/raw_product.h"
#include "spme/matching/cluster_builder.h"
#include "spme/matching/product_features.h"

#include <cstddef>
#include <string>
#include <vector>

namespace spme::matching {

// group_id_for returns the id of the group at the given 0-based position: "group-1", ...
[[nodiscard]] core::GroupId group_id_for(std::size_t ordinal);

// select_representative returns the index (into indices) of the member whose
// normalized name has the smallest total edit distance to the others; ties go
// to the longer name, then to the smaller product id.
[[nodiscard]] std::size_t select_representative(const std::vector<std::size_t>& indices,
                                                const std::vector<domain::RawProduct>& products,
                                                const std::vector<ProductFeatures>& features);

// summarize_group aggregates one cluster into a MatchingGroup:
// - price range and mean over raw amounts; members in different currencies
//   yield an empty currency and a kCurrencyMismatchWithinGroup warning
// - best member: cheapest listing (ties by supplier id, then product id)
// - confidence: 1.0 for a singleton, else the mean hybrid score of the
//   internal_scores (every directly scored pair inside the cluster)
// - status: singleton kUnmatched, confidence >= auto_confirm_threshold
//   kAutoMatched, otherwise kNeedsReview
// The price comparison is embedded.
[[nodiscard]] domain::MatchingGroup summarize_group(
    const ProductCluster& cluster, std::size_t ordinal,
    const std::vector<domain::RawProduct>& products, const std::vector<ProductFeatures>& features,
    const std::vector<domain::PairScore>& internal_scores, double auto_confirm_threshold);

// summarize_groups routes each pair score to its cluster and summarizes all clusters.
[[nodiscard]] std::vector<domain::MatchingGroup> summarize_groups(
    const std::vector<ProductCluster>& clusters, const std::vector<domain::RawProduct>& products,
    const std::vector<ProductFeatures>& features, const std::vector<domain::PairScore>& scores,
    double auto_confirm_threshold);

}  // namespace spme::matching
