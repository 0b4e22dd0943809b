#include "spme/matching/candidate_generator.h"

#include "spme/core/utf8.h"

#include <algorithm>

namespace spme::matching {

namespace {

constexpr double kPriceBandRatio = 0.7;

bool keeps_pair(const BlockingStrategy blocking, const domain::RawProduct& a,
                const domain::RawProduct& b, const std::string& key_a, const std::string& key_b) {
  switch (blocking) {
    case BlockingStrategy::kNone:
      return true;
    case BlockingStrategy::kFirstBigram:
      return key_a == key_b;
    case BlockingStrategy::kPriceBand:
      return price_similarity(a.price.amount, b.price.amount) > 0.0;
  }
  return true;
}

}  // namespace

double price_similarity(const double a, const double b) {
  if (a <= 0.0 || b <= 0.0) {
    return 0.0;
  }
  const double ratio = std::min(a, b) / std::max(a, b);
  return ratio >= kPriceBandRatio ? ratio : 0.0;
}

std::string first_bigram_key(const std::string_view normalized_name) {
  const std::u32string cps = core::decode_utf8(normalized_name);
  return core::encode_utf8(cps.substr(0, 2));
}

CandidateSet generate_candidates(const std::vector<domain::RawProduct>& products,
                                 const std::vector<ProductFeatures>& features,
                                 const BlockingStrategy blocking, const bool require_image_hash) {
  CandidateSet result;
  const std::size_t n = std::min(products.size(), features.size());
  if (n < 2) {
    return result;
  }

  std::vector<std::size_t> eligible;
  eligible.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (!require_image_hash || features[i].image_hash.has_value()) {
      eligible.push_back(i);
    }
  }

  std::vector<std::string> keys(n);
  if (blocking == BlockingStrategy::kFirstBigram) {
    for (const std::size_t i : eligible) {
      keys[i] = first_bigram_key(features[i].normalized_name);
    }
  }

  for (std::size_t x = 0; x < eligible.size(); ++x) {
    const std::size_t i = eligible[x];
    for (std::size_t y = x + 1; y < eligible.size(); ++y) {
      const std::size_t j = eligible[y];
      if (products[i].supplier_id == products[j].supplier_id) {
        continue;
      }
      ++result.naive_pair_count;
      if (keeps_pair(blocking, products[i], products[j], keys[i], keys[j])) {
        result.pairs.push_back(CandidatePair{i, j});
      }
    }
  }

  result.pruned_pair_count = result.naive_pair_count - result.pairs.size();
  return result;
}

}  // namespace spme::matching
