#pragma once

#include <optional>

namespace spme::similarity {

// HybridWeights combine the always-available text signal with the optional
// image signal. Weights are divided by their sum.
struct HybridWeights {
  double text{0.6};
  double image{0.4};
};

// hybrid_score returns the weighted blend when image similarity is present and
// falls back to text alone when it is not: a product without an image is "no
// signal", never a mismatch. Output is clamped to [0,1].
[[nodiscard]] double hybrid_score(double text_similarity, std::optional<double> image_similarity,
                                  const HybridWeights& weights = {});

}  // namespace spme::similarity
