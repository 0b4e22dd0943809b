#include "spme/matching/cluster_builder.h"

#include "spme/matching/union_find.h"

#include <map>
#include <string>

namespace spme::matching {

std::vector<ProductCluster> build_groups(const std::vector<domain::RawProduct>& products,
                                         const std::vector<domain::PairScore>& scores,
                                         const double threshold) {
  std::map<std::string, std::size_t> index_by_id;
  for (std::size_t i = 0; i < products.size(); ++i) {
    index_by_id.emplace(products[i].product_id.value, i);
  }

  UnionFind forest(products.size());
  for (const auto& score : scores) {
    if (score.hybrid_score < threshold) {
      continue;
    }
    const auto a = index_by_id.find(score.product_a_id.value);
    const auto b = index_by_id.find(score.product_b_id.value);
    if (a == index_by_id.end() || b == index_by_id.end()) {
      continue;
    }
    forest.unite(a->second, b->second);
  }

  // Walk in input order so cluster order and member order follow the input.
  std::vector<ProductCluster> clusters;
  std::map<std::size_t, std::size_t> cluster_by_root;
  for (std::size_t i = 0; i < products.size(); ++i) {
    const std::size_t root = forest.find(i);
    auto [it, inserted] = cluster_by_root.emplace(root, clusters.size());
    if (inserted) {
      clusters.emplace_back();
    }
    clusters[it->second].member_indices.push_back(i);
  }

  return clusters;
}

}  // namespace spme::matching
