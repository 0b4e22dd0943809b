#include "spme/matching/group_summarizer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace spme;
using Catch::Matchers::WithinAbs;

namespace {

struct Fixture {
  std::vector<domain::RawProduct> products;
  std::vector<matching::ProductFeatures> features;

  void add(const std::string& id, const std::string& supplier, const std::string& name,
           double price, const std::string& currency = "CNY") {
    domain::RawProduct p;
    p.product_id = core::ProductId{id};
    p.supplier_id = core::SupplierId{supplier};
    p.name = name;
    p.price = domain::Money{price, currency};
    products.push_back(p);

    matching::ProductFeatures f;
    f.product_id = p.product_id;
    f.normalized_name = name;
    features.push_back(f);
  }
};

domain::PairScore internal(const std::string& a, const std::string& b, double hybrid) {
  domain::PairScore s;
  s.product_a_id = core::ProductId{a};
  s.product_b_id = core::ProductId{b};
  s.hybrid_score = hybrid;
  s.is_match = true;
  return s;
}

}  // namespace

TEST_CASE("group ids follow cluster position", "[matching][summarizer]") {
  CHECK(matching::group_id_for(0).value == "group-1");
  CHECK(matching::group_id_for(9).value == "group-10");
}

TEST_CASE("summarize_group aggregates prices and confidence", "[matching][summarizer]") {
  Fixture fx;
  fx.add("p1", "s1", "鼠标a", 10.0);
  fx.add("p2", "s2", "鼠标b", 20.0);
  fx.add("p3", "s3", "鼠标c", 30.0);

  const matching::ProductCluster cluster{{0, 1, 2}};
  const auto group = matching::summarize_group(
      cluster, 0, fx.products, fx.features,
      {internal("p1", "p2", 0.9), internal("p2", "p3", 0.8)}, 0.80);

  CHECK(group.group_id.value == "group-1");
  REQUIRE(group.members.size() == 3);
  CHECK(group.members[0].value == "p1");
  CHECK(group.min_price == 10.0);
  CHECK(group.max_price == 30.0);
  CHECK_THAT(group.avg_price, WithinAbs(20.0, 1e-12));
  CHECK(group.currency == "CNY");
  CHECK(group.best_member_id.value == "p1");
  CHECK(group.best_supplier_id.value == "s1");
  CHECK_THAT(group.confidence_score, WithinAbs(0.85, 1e-12));
  CHECK(group.scored_pair_count == 2);
  CHECK(group.status == domain::GroupStatus::kAutoMatched);
  CHECK(group.warnings.empty());

  CHECK(group.comparison.group_id.value == "group-1");
  CHECK_THAT(group.comparison.savings_absolute, WithinAbs(20.0, 1e-12));
  CHECK_THAT(group.comparison.savings_percent, WithinAbs(200.0 / 3.0, 1e-9));

  SECTION("weak evidence needs review") {
    const auto weak = matching::summarize_group(
        cluster, 0, fx.products, fx.features,
        {internal("p1", "p2", 0.76), internal("p2", "p3", 0.76)}, 0.80);
    CHECK(weak.status == domain::GroupStatus::kNeedsReview);
  }
}

TEST_CASE("singletons are unmatched with full confidence", "[matching][summarizer]") {
  Fixture fx;
  fx.add("p1", "s1", "蓝牙耳机", 99.0);

  const auto group =
      matching::summarize_group(matching::ProductCluster{{0}}, 4, fx.products, fx.features, {}, 0.8);
  CHECK(group.group_id.value == "group-5");
  CHECK(group.status == domain::GroupStatus::kUnmatched);
  CHECK(group.confidence_score == 1.0);
  CHECK(group.representative_product_id.value == "p1");
  CHECK(group.representative_name == "蓝牙耳机");
  CHECK(group.min_price == group.max_price);
  CHECK(group.comparison.savings_absolute == 0.0);
  REQUIRE(group.comparison.ranked_members.size() == 1);
  CHECK(group.comparison.ranked_members[0].rank == 1);
}

TEST_CASE("mixed currencies raise a group warning", "[matching][summarizer]") {
  Fixture fx;
  fx.add("p1", "s1", "鼠标", 10.0, "CNY");
  fx.add("p2", "s2", "鼠标", 2.0, "USD");

  const auto group = matching::summarize_group(matching::ProductCluster{{0, 1}}, 0, fx.products,
                                               fx.features, {internal("p1", "p2", 1.0)}, 0.8);
  CHECK(group.currency.empty());
  REQUIRE(group.warnings.size() == 1);
  CHECK(group.warnings[0].kind == domain::WarningKind::kCurrencyMismatchWithinGroup);
  CHECK(group.warnings[0].refs == std::vector<std::string>{"group-1", "p1", "p2"});
  CHECK(group.best_member_id.value == "p2");
}

TEST_CASE("best member ties break on supplier id", "[matching][summarizer]") {
  Fixture fx;
  fx.add("p1", "s2", "鼠标", 10.0);
  fx.add("p2", "s1", "鼠标", 10.0);

  const auto group = matching::summarize_group(matching::ProductCluster{{0, 1}}, 0, fx.products,
                                               fx.features, {internal("p1", "p2", 1.0)}, 0.8);
  CHECK(group.best_member_id.value == "p2");
  CHECK(group.best_supplier_id.value == "s1");
}

TEST_CASE("representative minimizes total edit distance", "[matching][summarizer]") {
  Fixture fx;
  fx.add("p1", "s1", "无线鼠标", 10.0);
  fx.add("p2", "s2", "无线鼠标黑色", 10.0);
  fx.add("p3", "s3", "无线鼠标白色", 10.0);

  const std::vector<std::size_t> indices{0, 1, 2};
  CHECK(matching::select_representative(indices, fx.products, fx.features) == 1);

  SECTION("equal names fall back to the smaller product id") {
    Fixture same;
    same.add("z9", "s1", "鼠标", 1.0);
    same.add("a1", "s2", "鼠标", 1.0);
    CHECK(matching::select_representative({0, 1}, same.products, same.features) == 1);
  }
}

TEST_CASE("summarize_groups routes scores to their clusters", "[matching][summarizer]") {
  Fixture fx;
  fx.add("p1", "s1", "鼠标", 10.0);
  fx.add("p2", "s2", "鼠标", 12.0);
  fx.add("p3", "s3", "耳机", 50.0);

  domain::PairScore cross = internal("p1", "p3", 0.1);
  cross.is_match = false;

  const auto groups = matching::summarize_groups(
      {matching::ProductCluster{{0, 1}}, matching::ProductCluster{{2}}}, fx.products, fx.features,
      {internal("p1", "p2", 0.9), cross}, 0.8);
  REQUIRE(groups.size() == 2);
  CHECK(groups[0].scored_pair_count == 1);
  CHECK_THAT(groups[0].confidence_score, WithinAbs(0.9, 1e-12));
  CHECK(groups[1].scored_pair_count == 0);
  CHECK(groups[1].group_id.value == "group-2");
}

TEST_CASE("each group's price comparison covers its own members", "[matching][summarizer]") {
  Fixture fx;
  std::vector<matching::ProductCluster> clusters;
  for (int i = 0; i < 50; ++i) {
    fx.add("p" + std::to_string(i), "s" + std::to_string(i), "商品", 1.0 + i);
    clusters.push_back(matching::ProductCluster{{static_cast<std::size_t>(i)}});
  }

  const auto groups = matching::summarize_groups(clusters, fx.products, fx.features, {}, 0.8);
  REQUIRE(groups.size() == 50);
  for (std::size_t i = 0; i < groups.size(); ++i) {
    REQUIRE(groups[i].comparison.ranked_members.size() == 1);
    CHECK(groups[i].comparison.ranked_members[0].product_id == groups[i].members[0]);
    CHECK(groups[i].comparison.group_id == groups[i].group_id);
  }
}
