#pragma once

#include "spme/core/ids.h"

#include <optional>

namespace spme::domain {

// PairScore is the symmetric score of one candidate pair.
// product_a_id < product_b_id always holds, so each unordered pair has one record.
// image_similarity is empty when either product lacks an image or the two
// hashes are not comparable; that is "no signal", not zero similarity.
struct PairScore {
  core::ProductId product_a_id;
  core::ProductId product_b_id;
  double text_similarity{0.0};
  std::optional<double> image_similarity;
  double hybrid_score{0.0};
  bool is_match{false};
};

}  // namespace spme::domain
