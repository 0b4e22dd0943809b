#include "spme/similarity/image_similarity.h"

#include <bit>
#include <cstdint>

namespace spme::similarity {

std::string_view image_error_to_string(const ImageSimilarityError error) {
  switch (error) {
    case ImageSimilarityError::kHashVersionMismatch:
      return "hash_version_mismatch";
    case ImageSimilarityError::kEmptyHash:
      return "empty_hash";
  }
  return "unknown";
}

core::Result<std::size_t, ImageSimilarityError> hamming_distance(const domain::PerceptualHash& a,
                                                                 const domain::PerceptualHash& b) {
  using R = core::Result<std::size_t, ImageSimilarityError>;

  if (a.bit_length != b.bit_length) {
    return R::err(ImageSimilarityError::kHashVersionMismatch);
  }
  if (!a.algorithm.empty() && !b.algorithm.empty() && a.algorithm != b.algorithm) {
    return R::err(ImageSimilarityError::kHashVersionMismatch);
  }
  if (a.empty()) {
    return R::err(ImageSimilarityError::kEmptyHash);
  }

  // Missing words read as zero and bits past bit_length are masked off,
  // matching PerceptualHash::bit().
  constexpr std::size_t kWordBits = 64;
  const std::size_t word_count = (a.bit_length + kWordBits - 1) / kWordBits;
  const std::size_t tail_bits = a.bit_length % kWordBits;

  std::size_t distance = 0;
  for (std::size_t i = 0; i < word_count; ++i) {
    const std::uint64_t wa = i < a.words.size() ? a.words[i] : 0;
    const std::uint64_t wb = i < b.words.size() ? b.words[i] : 0;
    std::uint64_t diff = wa ^ wb;
    if (i + 1 == word_count && tail_bits != 0) {
      diff &= (1ULL << tail_bits) - 1;
    }
    distance += static_cast<std::size_t>(std::popcount(diff));
  }

  return R::ok(distance);
}

core::Result<double, ImageSimilarityError> image_similarity(const domain::PerceptualHash& a,
                                                            const domain::PerceptualHash& b) {
  using R = core::Result<double, ImageSimilarityError>;

  const auto distance = hamming_distance(a, b);
  if (!distance.has_value()) {
    return R::err(distance.error());
  }

  return R::ok(1.0 - static_cast<double>(distance.value()) / static_cast<double>(a.bit_length));
}

}  // namespace spme::similarity
