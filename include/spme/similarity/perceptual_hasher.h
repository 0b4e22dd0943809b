#pragma once

#include "spme/core/result.h"
#include "spme/domain/image_ref.h"
#include "spme/domain/perceptual_hash.h"

#include <opencv2/core.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spme::similarity {

// IPerceptualHasher is the pluggable hash strategy. A batch must be hashed with
// a single strategy; the algorithm() tag is stamped on every hash produced so
// that cross-version comparisons are detected instead of silently miscompared.
//
// Input is an 8-bit cv::Mat with 1 (gray), 3 (BGR) or 4 (BGRA) channels.
class IPerceptualHasher {
 public:
  virtual ~IPerceptualHasher() = default;

  [[nodiscard]] virtual std::string algorithm() const = 0;
  [[nodiscard]] virtual core::Result<domain::PerceptualHash, std::string> hash(
      const cv::Mat& image) const = 0;

 protected:
  IPerceptualHasher() = default;
  IPerceptualHasher(const IPerceptualHasher&) = default;
  IPerceptualHasher& operator=(const IPerceptualHasher&) = default;
  IPerceptualHasher(IPerceptualHasher&&) = default;
  IPerceptualHasher& operator=(IPerceptualHasher&&) = default;
};

// AverageHasher (aHash): area-resize to grid x grid, set bit (row * grid + col)
// when the cell is brighter than the grid mean.
class AverageHasher final : public IPerceptualHasher {
 public:
  explicit AverageHasher(std::size_t grid = 8) : grid_(grid) {}

  [[nodiscard]] std::string algorithm() const override;
  [[nodiscard]] core::Result<domain::PerceptualHash, std::string> hash(
      const cv::Mat& image) const override;

 private:
  std::size_t grid_;
};

// DifferenceHasher (dHash): area-resize to (grid + 1) x grid, set bit
// (row * grid + col) when a cell is brighter than its right neighbour.
// Gradient-based, so it tolerates uniform brightness and contrast changes.
class DifferenceHasher final : public IPerceptualHasher {
 public:
  explicit DifferenceHasher(std::size_t grid = 8) : grid_(grid) {}

  [[nodiscard]] std::string algorithm() const override;
  [[nodiscard]] core::Result<domain::PerceptualHash, std::string> hash(
      const cv::Mat& image) const override;

 private:
  std::size_t grid_;
};

enum class HashAlgorithm {
  kDifference,  // default
  kAverage,
};

[[nodiscard]] std::string_view hash_algorithm_to_string(HashAlgorithm algorithm);
[[nodiscard]] std::optional<HashAlgorithm> hash_algorithm_from_string(std::string_view value);

[[nodiscard]] std::unique_ptr<IPerceptualHasher> make_hasher(HashAlgorithm algorithm,
                                                             std::size_t grid = 8);

// load_image_bytes returns the encoded content of ref, reading the file when ref
// names a path.
[[nodiscard]] core::Result<std::vector<std::uint8_t>, std::string> load_image_bytes(
    const domain::ImageRef& ref);

// decode_image decodes encoded image bytes into an 8-bit grayscale matrix.
[[nodiscard]] core::Result<cv::Mat, std::string> decode_image(
    const std::vector<std::uint8_t>& bytes);

// image_cache_key returns the memoization key of encoded image content under a
// hasher algorithm tag.
[[nodiscard]] std::string image_cache_key(const std::vector<std::uint8_t>& bytes,
                                          std::string_view algorithm);

}  // namespace spme::similarity
