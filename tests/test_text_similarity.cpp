#include "spme/core/normalization.h"
#include "spme/similarity/edit_distance.h"
#include "spme/similarity/text_similarity.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace spme;
using Catch::Matchers::WithinAbs;

TEST_CASE("text_similarity basic properties", "[similarity][text]") {
  const std::vector<std::string> names = {"无线鼠标24g", "无线鼠标24g黑色", "蓝牙耳机", "a", "ab",
                                          "usb数据线", ""};

  SECTION("symmetric") {
    for (const auto& a : names) {
      for (const auto& b : names) {
        CHECK(similarity::text_similarity(a, b) == similarity::text_similarity(b, a));
      }
    }
  }

  SECTION("self-similarity is 1 for non-empty names") {
    for (const auto& a : names) {
      if (!a.empty()) {
        CHECK_THAT(similarity::text_similarity(a, a), WithinAbs(1.0, 1e-12));
      }
    }
  }

  SECTION("bounded to [0,1]") {
    for (const auto& a : names) {
      for (const auto& b : names) {
        const double s = similarity::text_similarity(a, b);
        CHECK(s >= 0.0);
        CHECK(s <= 1.0);
      }
    }
  }

  SECTION("two empty names score 0") {
    CHECK(similarity::text_similarity("", "") == 0.0);
  }
}

TEST_CASE("text_similarity matches the weighted blend", "[similarity][text]") {
  const auto a = similarity::make_text_profile(core::normalize_product_name("无线鼠标 2.4G"));
  const auto b = similarity::make_text_profile(core::normalize_product_name("无线鼠标2.4G黑色"));

  // 7 of 9 characters, 6 of 8 bigrams, 5 of 7 trigrams shared.
  CHECK_THAT(similarity::char_jaccard(a, b), WithinAbs(7.0 / 9.0, 1e-12));
  CHECK_THAT(similarity::ngram_jaccard(a, b, 2), WithinAbs(6.0 / 8.0, 1e-12));
  CHECK_THAT(similarity::ngram_jaccard(a, b, 3), WithinAbs(5.0 / 7.0, 1e-12));
  CHECK_THAT(similarity::text_similarity(a, b),
             WithinAbs(0.4 * 7.0 / 9.0 + 0.4 * 0.75 + 0.2 * 5.0 / 7.0, 1e-12));

  SECTION("unrelated names score 0") {
    const auto c = similarity::make_text_profile("蓝牙耳机");
    CHECK(similarity::text_similarity(a, c) == 0.0);
  }

  SECTION("weights are normalized by their sum") {
    const similarity::TextWeights doubled{0.8, 0.8, 0.4};
    CHECK_THAT(similarity::text_similarity(a, b, doubled),
               WithinAbs(similarity::text_similarity(a, b), 1e-12));
  }
}

TEST_CASE("n-gram rules for short names", "[similarity][text]") {
  const auto one = similarity::make_text_profile("a");
  const auto other = similarity::make_text_profile("b");
  const auto two = similarity::make_text_profile("ab");

  CHECK(similarity::ngram_jaccard(one, one, 2) == 1.0);
  CHECK(similarity::ngram_jaccard(one, other, 2) == 0.0);
  CHECK(similarity::ngram_jaccard(one, two, 2) == 0.0);
  CHECK(similarity::ngram_jaccard(two, two, 3) == 1.0);
  CHECK(similarity::text_similarity(one, other) == 0.0);

  const auto empty = similarity::make_text_profile("");
  CHECK(similarity::ngram_jaccard(empty, empty, 2) == 0.0);
}

TEST_CASE("levenshtein_distance counts code point edits", "[similarity][edit]") {
  CHECK(similarity::levenshtein_distance(U"kitten", U"sitting") == 3);
  CHECK(similarity::levenshtein_distance(U"", U"abc") == 3);
  CHECK(similarity::levenshtein_distance(U"无线鼠标黑色", U"无线鼠标白色") == 1);
  CHECK(similarity::levenshtein_distance(U"无线鼠标", U"无线鼠标") == 0);
}
