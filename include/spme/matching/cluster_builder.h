#pragma once

#include "spme/domain/pair_score.h"
#include "spme/domain/raw_product.h"

#include <cstddef>
#include <vector>

namespace spme::matching {

// ProductCluster lists member input indices in ascending order.
struct ProductCluster {
  std::vector<std::size_t> member_indices;
};

// build_groups partitions products into clusters by uniting every pair whose
// hybrid_score is >= threshold. The partition does not depend on the order of
// scores. Clusters are ordered by their first member's input index, so every
// product lands in exactly one cluster and singletons are kept.
// Pair scores naming unknown product ids are ignored.
[[nodiscard]] std::vector<ProductCluster> build_groups(
    const std::vector<domain::RawProduct>& products, const std::vector<domain::PairScore>& scores,
    double threshold);

}  // namespace spme::matching
