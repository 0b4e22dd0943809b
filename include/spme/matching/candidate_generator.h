#pragma once

#include "spme/domain/raw_product.h"
#include "spme/matching/match_config.h"
#include "spme/matching/product_features.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace spme::matching {

// CandidatePair references two products by input index, first < second.
struct CandidatePair {
  std::size_t first{0};
  std::size_t second{0};

  bool operator==(const CandidatePair&) const = default;
};

// CandidateSet is the list of pairs to score, ordered by (first, second).
// naive_pair_count counts every eligible cross-supplier pair; pruned_pair_count
// is how many of those the blocking strategy dropped.
struct CandidateSet {
  std::vector<CandidatePair> pairs;
  std::size_t naive_pair_count{0};
  std::size_t pruned_pair_count{0};
};

// price_similarity returns min/max when the two prices are within 30% of each
// other (ratio >= 0.7), and 0 otherwise or when either price is not positive.
[[nodiscard]] double price_similarity(double a, double b);

// first_bigram_key returns the first two code points of a normalized name
// (the whole name when shorter).
[[nodiscard]] std::string first_bigram_key(std::string_view normalized_name);

// generate_candidates enumerates cross-supplier pairs; products of the same
// supplier are never compared. With require_image_hash only products carrying
// a usable hash take part.
[[nodiscard]] CandidateSet generate_candidates(const std::vector<domain::RawProduct>& products,
                                               const std::vector<ProductFeatures>& features,
                                               BlockingStrategy blocking,
                                               bool require_image_hash = false);

}  // namespace spme::matching
