#include "spme/similarity/hybrid_scorer.h"

#include <algorithm>

namespace spme::similarity {

double hybrid_score(const double text_similarity, const std::optional<double> image_similarity,
                    const HybridWeights& weights) {
  const double text = std::clamp(text_similarity, 0.0, 1.0);
  if (!image_similarity.has_value()) {
    return text;
  }

  const double total = weights.text + weights.image;
  if (total <= 0.0) {
    return text;
  }

  const double image = std::clamp(image_similarity.value(), 0.0, 1.0);
  return std::clamp((weights.text * text + weights.image * image) / total, 0.0, 1.0);
}

}  // namespace spme::similarity
