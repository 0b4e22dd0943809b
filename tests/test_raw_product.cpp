#include "spme/domain/matching_group.h"
#include "spme/domain/raw_product.h"
#include "spme/domain/warning.h"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace spme;

namespace {

domain::RawProduct valid_product() {
  domain::RawProduct p;
  p.product_id = core::ProductId{"p1"};
  p.supplier_id = core::SupplierId{"s1"};
  p.name = "无线鼠标";
  p.price = domain::Money{25.0, "CNY"};
  return p;
}

}  // namespace

TEST_CASE("RawProduct validation", "[domain][raw_product]") {
  SECTION("a complete record is valid") {
    CHECK(valid_product().validate().has_value());
  }

  SECTION("zero price is valid") {
    auto p = valid_product();
    p.price.amount = 0.0;
    CHECK(p.validate().has_value());
  }

  SECTION("whitespace-only name is accepted") {
    auto p = valid_product();
    p.name = "   ";
    CHECK(p.validate().has_value());
  }

  SECTION("missing product id") {
    auto p = valid_product();
    p.product_id.value = "  ";
    const auto r = p.validate();
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().find("product_id") != std::string::npos);
  }

  SECTION("missing supplier id") {
    auto p = valid_product();
    p.supplier_id.value.clear();
    const auto r = p.validate();
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().find("supplier_id") != std::string::npos);
  }

  SECTION("missing name") {
    auto p = valid_product();
    p.name.clear();
    CHECK_FALSE(p.validate().has_value());
  }

  SECTION("negative or non-finite price") {
    auto p = valid_product();
    p.price.amount = -1.0;
    CHECK_FALSE(p.validate().has_value());
    p.price.amount = std::numeric_limits<double>::quiet_NaN();
    CHECK_FALSE(p.validate().has_value());
    p.price.amount = std::numeric_limits<double>::infinity();
    CHECK_FALSE(p.validate().has_value());
  }

  SECTION("image reference must name bytes or a path, not both") {
    auto p = valid_product();
    p.image = domain::ImageRef{};
    CHECK(p.has_image_reference());
    CHECK_FALSE(p.validate().has_value());

    p.image->path = "/tmp/photo.jpg";
    CHECK(p.validate().has_value());

    p.image->bytes = {0xFF, 0xD8};
    CHECK_FALSE(p.validate().has_value());
  }
}

TEST_CASE("enum string conversions", "[domain]") {
  CHECK(domain::group_status_to_string(domain::GroupStatus::kNeedsReview) == "needs_review");
  CHECK(domain::group_status_from_string("auto_matched") == domain::GroupStatus::kAutoMatched);
  CHECK(domain::group_status_from_string("bogus") == std::nullopt);

  CHECK(domain::warning_kind_to_string(domain::WarningKind::kBlockingPrunedPairs) ==
        "blocking_pruned_pairs");
  CHECK(domain::warning_kind_from_string("currency_mismatch_within_group") ==
        domain::WarningKind::kCurrencyMismatchWithinGroup);
  CHECK(domain::warning_kind_from_string("image_unreadable") ==
        domain::WarningKind::kImageUnreadable);
  CHECK(domain::warning_kind_to_string(domain::WarningKind::kUntaggedImageHash) ==
        "untagged_image_hash");
}
