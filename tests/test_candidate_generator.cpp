#include "spme/matching/candidate_generator.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace spme;
using Catch::Matchers::WithinAbs;

namespace {

struct Batch {
  std::vector<domain::RawProduct> products;
  std::vector<matching::ProductFeatures> features;

  void add(const std::string& id, const std::string& supplier, const std::string& normalized,
           double price) {
    domain::RawProduct p;
    p.product_id = core::ProductId{id};
    p.supplier_id = core::SupplierId{supplier};
    p.name = normalized;
    p.price = domain::Money{price, "CNY"};
    products.push_back(p);

    matching::ProductFeatures f;
    f.product_id = p.product_id;
    f.normalized_name = normalized;
    features.push_back(f);
  }
};

}  // namespace

TEST_CASE("generate_candidates never pairs a supplier with itself", "[matching][candidates]") {
  Batch batch;
  batch.add("a1", "s1", "无线鼠标", 10.0);
  batch.add("a2", "s1", "无线鼠标", 10.0);
  batch.add("b1", "s2", "无线鼠标", 10.0);

  const auto set = matching::generate_candidates(batch.products, batch.features,
                                                 matching::BlockingStrategy::kNone);
  REQUIRE(set.pairs.size() == 2);
  CHECK(set.pairs[0] == matching::CandidatePair{0, 2});
  CHECK(set.pairs[1] == matching::CandidatePair{1, 2});
  CHECK(set.naive_pair_count == 2);
  CHECK(set.pruned_pair_count == 0);
}

TEST_CASE("blocking strategies prune the pair space", "[matching][candidates]") {
  SECTION("first bigram") {
    Batch batch;
    batch.add("a", "s1", "无线鼠标", 10.0);
    batch.add("b", "s2", "无线键盘", 10.0);
    batch.add("c", "s3", "蓝牙耳机", 10.0);

    const auto set = matching::generate_candidates(batch.products, batch.features,
                                                   matching::BlockingStrategy::kFirstBigram);
    REQUIRE(set.pairs.size() == 1);
    CHECK(set.pairs[0] == matching::CandidatePair{0, 1});
    CHECK(set.naive_pair_count == 3);
    CHECK(set.pruned_pair_count == 2);
  }

  SECTION("price band") {
    Batch batch;
    batch.add("a", "s1", "x", 10.0);
    batch.add("b", "s2", "y", 12.0);
    batch.add("c", "s3", "z", 20.0);

    const auto set = matching::generate_candidates(batch.products, batch.features,
                                                   matching::BlockingStrategy::kPriceBand);
    REQUIRE(set.pairs.size() == 1);
    CHECK(set.pairs[0] == matching::CandidatePair{0, 1});
    CHECK(set.pruned_pair_count == 2);
  }
}

TEST_CASE("image-only candidates require a usable hash", "[matching][candidates]") {
  Batch batch;
  batch.add("a", "s1", "x", 10.0);
  batch.add("b", "s2", "x", 10.0);
  batch.add("c", "s3", "x", 10.0);
  batch.features[0].image_hash = domain::PerceptualHash::from_u64(1);
  batch.features[2].image_hash = domain::PerceptualHash::from_u64(3);

  const auto set = matching::generate_candidates(
      batch.products, batch.features, matching::BlockingStrategy::kNone, /*require_image_hash=*/true);
  REQUIRE(set.pairs.size() == 1);
  CHECK(set.pairs[0] == matching::CandidatePair{0, 2});
  CHECK(set.naive_pair_count == 1);
}

TEST_CASE("degenerate batches yield no candidates", "[matching][candidates]") {
  Batch batch;
  auto set = matching::generate_candidates(batch.products, batch.features,
                                           matching::BlockingStrategy::kNone);
  CHECK(set.pairs.empty());
  CHECK(set.naive_pair_count == 0);

  batch.add("a", "s1", "x", 1.0);
  set = matching::generate_candidates(batch.products, batch.features,
                                      matching::BlockingStrategy::kNone);
  CHECK(set.pairs.empty());
}

TEST_CASE("price_similarity", "[matching][candidates]") {
  CHECK_THAT(matching::price_similarity(7.0, 10.0), WithinAbs(0.7, 1e-12));
  CHECK_THAT(matching::price_similarity(10.0, 8.0), WithinAbs(0.8, 1e-12));
  CHECK(matching::price_similarity(6.9, 10.0) == 0.0);
  CHECK(matching::price_similarity(0.0, 5.0) == 0.0);
  CHECK(matching::price_similarity(0.0, 0.0) == 0.0);
}

TEST_CASE("first_bigram_key works on code points", "[matching][candidates]") {
  CHECK(matching::first_bigram_key("无线鼠标") == "无线");
  CHECK(matching::first_bigram_key("a") == "a");
  CHECK(matching::first_bigram_key("").empty());
}
