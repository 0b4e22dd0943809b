#include "spme/domain/perceptual_hash.h"
#include "spme/similarity/image_similarity.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace spme;
using Catch::Matchers::WithinAbs;

TEST_CASE("image_similarity is one minus normalized Hamming distance", "[similarity][image]") {
  const auto zero = domain::PerceptualHash::from_u64(0, "dhash8-v1");
  const auto ones = domain::PerceptualHash::from_u64(~0ULL, "dhash8-v1");
  const auto low_nibble = domain::PerceptualHash::from_u64(0xF, "dhash8-v1");

  SECTION("identical hashes score 1") {
    const auto s = similarity::image_similarity(zero, zero);
    REQUIRE(s.has_value());
    CHECK(s.value() == 1.0);
  }

  SECTION("complementary hashes score 0") {
    const auto s = similarity::image_similarity(zero, ones);
    REQUIRE(s.has_value());
    CHECK(s.value() == 0.0);
  }

  SECTION("four differing bits of 64") {
    const auto d = similarity::hamming_distance(low_nibble, zero);
    REQUIRE(d.has_value());
    CHECK(d.value() == 4);

    const auto s = similarity::image_similarity(low_nibble, zero);
    REQUIRE(s.has_value());
    CHECK_THAT(s.value(), WithinAbs(0.9375, 1e-12));
  }

  SECTION("symmetric") {
    CHECK(similarity::image_similarity(low_nibble, ones).value() ==
          similarity::image_similarity(ones, low_nibble).value());
  }
}

TEST_CASE("incomparable hashes are reported, not scored", "[similarity][image]") {
  const auto a = domain::PerceptualHash::from_u64(0x1234, "dhash8-v1");

  SECTION("different bit lengths") {
    const auto b = domain::PerceptualHash::zeros(256, "dhash8-v1");
    const auto s = similarity::image_similarity(a, b);
    REQUIRE_FALSE(s.has_value());
    CHECK(s.error() == similarity::ImageSimilarityError::kHashVersionMismatch);
  }

  SECTION("different algorithm tags") {
    const auto b = domain::PerceptualHash::from_u64(0x1234, "ahash8-v1");
    const auto s = similarity::image_similarity(a, b);
    REQUIRE_FALSE(s.has_value());
    CHECK(s.error() == similarity::ImageSimilarityError::kHashVersionMismatch);
    CHECK(similarity::image_error_to_string(s.error()) == "hash_version_mismatch");
  }

  SECTION("an untagged hash is comparable with a tagged one") {
    const auto b = domain::PerceptualHash::from_u64(0x1234);
    const auto s = similarity::image_similarity(a, b);
    REQUIRE(s.has_value());
    CHECK(s.value() == 1.0);
  }

  SECTION("empty hashes") {
    const domain::PerceptualHash empty;
    const auto s = similarity::image_similarity(empty, empty);
    REQUIRE_FALSE(s.has_value());
    CHECK(s.error() == similarity::ImageSimilarityError::kEmptyHash);
  }
}

TEST_CASE("PerceptualHash hex encoding", "[domain][image]") {
  const auto parsed = domain::PerceptualHash::from_hex("ff00");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().bit_length == 16);
  CHECK(parsed.value().bit(8));
  CHECK_FALSE(parsed.value().bit(0));
  CHECK(parsed.value().to_hex() == "ff00");

  CHECK(domain::PerceptualHash::from_u64(0xABCDEF).to_hex() == "0000000000abcdef");

  SECTION("invalid input") {
    CHECK_FALSE(domain::PerceptualHash::from_hex("").has_value());
    CHECK_FALSE(domain::PerceptualHash::from_hex("12xz").has_value());
  }

  SECTION("hashes wider than one word") {
    const std::string hex(64, 'f');
    const auto wide = domain::PerceptualHash::from_hex(hex);
    REQUIRE(wide.has_value());
    CHECK(wide.value().bit_length == 256);
    CHECK(wide.value().words.size() == 4);
    CHECK(wide.value().to_hex() == hex);
  }
}
