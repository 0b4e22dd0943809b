#pragma once

#include "spme/core/result.h"
#include "spme/domain/perceptual_hash.h"

#include <cstddef>
#include <optional>
#include <string_view>

namespace spme::similarity {

enum class ImageSimilarityError {
  kHashVersionMismatch,  // bit lengths or algorithm tags differ
  kEmptyHash,            // zero-length hash cannot be compared
};

[[nodiscard]] std::string_view image_error_to_string(ImageSimilarityError error);

// hamming_distance counts differing bits of two comparable hashes.
[[nodiscard]] core::Result<std::size_t, ImageSimilarityError> hamming_distance(
    const domain::PerceptualHash& a, const domain::PerceptualHash& b);

// image_similarity = 1 - hamming / bit_length, in [0,1] and symmetric.
// Any error means the pair's image score is unavailable; callers must not
// substitute zero.
[[nodiscard]] core::Result<double, ImageSimilarityError> image_similarity(
    const domain::PerceptualHash& a, const domain::PerceptualHash& b);

}  // namespace spme::similarity
