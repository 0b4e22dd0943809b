#include "spme/matching/cluster_builder.h"
#include "spme/matching/union_find.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace spme;

TEST_CASE("UnionFind merges sets transitively", "[matching][union_find]") {
  matching::UnionFind uf(5);
  CHECK(uf.size() == 5);
  CHECK_FALSE(uf.connected(0, 2));

  CHECK(uf.unite(0, 1));
  CHECK(uf.unite(1, 2));
  CHECK_FALSE(uf.unite(0, 2));

  CHECK(uf.connected(0, 2));
  CHECK_FALSE(uf.connected(0, 3));
  CHECK(uf.find(3) == 3);
}

namespace {

std::vector<domain::RawProduct> products_named(const std::vector<std::string>& ids) {
  std::vector<domain::RawProduct> products;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    domain::RawProduct p;
    p.product_id = core::ProductId{ids[i]};
    p.supplier_id = core::SupplierId{"s" + std::to_string(i)};
    p.name = ids[i];
    products.push_back(p);
  }
  return products;
}

domain::PairScore score(const std::string& a, const std::string& b, double hybrid) {
  domain::PairScore s;
  s.product_a_id = core::ProductId{a};
  s.product_b_id = core::ProductId{b};
  s.hybrid_score = hybrid;
  return s;
}

}  // namespace

TEST_CASE("build_groups partitions products by threshold", "[matching][cluster]") {
  const auto products = products_named({"a", "b", "c", "d"});

  SECTION("a score equal to the threshold is a match") {
    const auto clusters = matching::build_groups(products, {score("a", "c", 0.75)}, 0.75);
    REQUIRE(clusters.size() == 3);
    CHECK(clusters[0].member_indices == std::vector<std::size_t>{0, 2});
    CHECK(clusters[1].member_indices == std::vector<std::size_t>{1});
    CHECK(clusters[2].member_indices == std::vector<std::size_t>{3});
  }

  SECTION("a score just below the threshold is not") {
    const auto clusters = matching::build_groups(products, {score("a", "c", 0.7499)}, 0.75);
    CHECK(clusters.size() == 4);
  }

  SECTION("chains merge transitively") {
    const auto clusters =
        matching::build_groups(products, {score("c", "d", 0.9), score("b", "c", 0.8)}, 0.75);
    REQUIRE(clusters.size() == 2);
    CHECK(clusters[0].member_indices == std::vector<std::size_t>{0});
    CHECK(clusters[1].member_indices == std::vector<std::size_t>{1, 2, 3});
  }

  SECTION("score order does not change the partition") {
    std::vector<domain::PairScore> scores{score("a", "b", 0.9), score("c", "d", 0.9),
                                          score("b", "c", 0.1)};
    const auto forward = matching::build_groups(products, scores, 0.5);
    std::reverse(scores.begin(), scores.end());
    const auto backward = matching::build_groups(products, scores, 0.5);
    REQUIRE(forward.size() == backward.size());
    for (std::size_t i = 0; i < forward.size(); ++i) {
      CHECK(forward[i].member_indices == backward[i].member_indices);
    }
  }

  SECTION("unknown ids are ignored") {
    const auto clusters = matching::build_groups(products, {score("a", "zzz", 1.0)}, 0.5);
    CHECK(clusters.size() == 4);
  }
}
