#include "spme/similarity/text_similarity.h"

#include "spme/core/utf8.h"

#include <algorithm>

namespace spme::similarity {

namespace {

// Size of the intersection of two sorted, deduplicated ranges.
template <typename T>
std::size_t sorted_intersection_size(const std::vector<T>& a, const std::vector<T>& b) {
  std::size_t count = 0;
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia < *ib) {
      ++ia;
    } else if (*ib < *ia) {
      ++ib;
    } else {
      ++count;
      ++ia;
      ++ib;
    }
  }
  return count;
}

template <typename T>
double jaccard(const std::vector<T>& a, const std::vector<T>& b) {
  const std::size_t intersection = sorted_intersection_size(a, b);
  const std::size_t union_size = a.size() + b.size() - intersection;
  if (union_size == 0) {
    return 0.0;
  }
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::vector<std::u32string> sliding_ngrams(const std::u32string& text, const std::size_t n) {
  std::vector<std::u32string> grams;
  if (text.size() < n) {
    return grams;
  }
  grams.reserve(text.size() - n + 1);
  for (std::size_t i = 0; i + n <= text.size(); ++i) {
    grams.push_back(text.substr(i, n));
  }
  std::sort(grams.begin(), grams.end());
  grams.erase(std::unique(grams.begin(), grams.end()), grams.end());
  return grams;
}

double clamp_unit(const double value) {
  return std::clamp(value, 0.0, 1.0);
}

}  // namespace

TextProfile make_text_profile(const std::string_view normalized_name) {
  TextProfile profile;
  profile.code_points = core::decode_utf8(normalized_name);

  profile.chars.assign(profile.code_points.begin(), profile.code_points.end());
  std::sort(profile.chars.begin(), profile.chars.end());
  profile.chars.erase(std::unique(profile.chars.begin(), profile.chars.end()),
                      profile.chars.end());

  profile.bigrams = sliding_ngrams(profile.code_points, 2);
  profile.trigrams = sliding_ngrams(profile.code_points, 3);
  return profile;
}

double char_jaccard(const TextProfile& a, const TextProfile& b) {
  return jaccard(a.chars, b.chars);
}

double ngram_jaccard(const TextProfile& a, const TextProfile& b, const std::size_t n) {
  if (a.code_points.size() < n || b.code_points.size() < n) {
    const bool identical_short = !a.code_points.empty() && a.code_points == b.code_points;
    return identical_short ? 1.0 : 0.0;
  }

  if (n == 2) {
    return jaccard(a.bigrams, b.bigrams);
  }
  if (n == 3) {
    return jaccard(a.trigrams, b.trigrams);
  }
  return jaccard(sliding_ngrams(a.code_points, n), sliding_ngrams(b.code_points, n));
}

double text_similarity(const TextProfile& a, const TextProfile& b, const TextWeights& weights) {
  const double total = weights.char_jaccard + weights.bigram + weights.trigram;
  if (total <= 0.0) {
    return 0.0;
  }

  const double blended = weights.char_jaccard * char_jaccard(a, b) +
                         weights.bigram * ngram_jaccard(a, b, 2) +
                         weights.trigram * ngram_jaccard(a, b, 3);
  return clamp_unit(blended / total);
}

double text_similarity(const std::string_view a, const std::string_view b,
                       const TextWeights& weights) {
  return text_similarity(make_text_profile(a), make_text_profile(b), weights);
}

}  // namespace spme::similarity
