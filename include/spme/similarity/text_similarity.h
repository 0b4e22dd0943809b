#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace spme::similarity {

// TextWeights blends the three set-overlap measures. Defaults were tuned on
// supplier listings; weights are divided by their sum, so any non-negative
// triple with a positive sum keeps the result in [0,1].
struct TextWeights {
  double char_jaccard{0.4};
  double bigram{0.4};
  double trigram{0.2};
};

// TextProfile holds the per-name sets every pair comparison needs, so that a
// batch of n products decodes and slices each name once instead of n-1 times.
// All vectors are sorted and deduplicated.
struct TextProfile {
  std::u32string code_points;
  std::vector<char32_t> chars;
  std::vector<std::u32string> bigrams;
  std::vector<std::u32string> trigrams;
};

// make_text_profile builds the profile of an already-normalized name.
[[nodiscard]] TextProfile make_text_profile(std::string_view normalized_name);

// char_jaccard: |set(a) ∩ set(b)| / |set(a) ∪ set(b)|; 0 when both are empty.
[[nodiscard]] double char_jaccard(const TextProfile& a, const TextProfile& b);

// ngram_jaccard over sliding windows of n code points (n = 2 or 3).
// Names shorter than n have no n-grams: the score is 1 if both names are
// identical and non-empty, 0 otherwise.
[[nodiscard]] double ngram_jaccard(const TextProfile& a, const TextProfile& b, std::size_t n);

// text_similarity is the weighted blend, in [0,1], symmetric, and 1 for
// identical non-empty names.
[[nodiscard]] double text_similarity(const TextProfile& a, const TextProfile& b,
                                     const TextWeights& weights = {});

// Convenience overload for two normalized names.
[[nodiscard]] double text_similarity(std::string_view a, std::string_view b,
                                     const TextWeights& weights = {});

}  // namespace spme::similarity
