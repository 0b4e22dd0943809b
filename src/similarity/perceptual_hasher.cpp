#include "spme/similarity/perceptual_hasher.h"

#include "spme/core/hashing.h"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <fstream>

namespace spme::similarity {

namespace {

constexpr std::size_t kMinGrid = 2;
constexpr std::size_t kMaxGrid = 64;

// to_gray checks the hasher input and returns a single-channel view or copy of it.
core::Result<cv::Mat, std::string> to_gray(const cv::Mat& image, const std::size_t grid) {
  using R = core::Result<cv::Mat, std::string>;

  if (image.empty()) {
    return R::err("image is empty");
  }
  if (image.depth() != CV_8U) {
    return R::err("image must have 8-bit channels");
  }
  if (grid < kMinGrid || grid > kMaxGrid) {
    return R::err("hash grid must be between 2 and 64, got " + std::to_string(grid));
  }

  switch (image.channels()) {
    case 1:
      return R::ok(image);
    case 3: {
      cv::Mat gray;
      cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
      return R::ok(gray);
    }
    case 4: {
      cv::Mat gray;
      cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
      return R::ok(gray);
    }
    default:
      return R::err("image must have 1, 3 or 4 channels, got " +
                    std::to_string(image.channels()));
  }
}

}  // namespace

core::Result<std::vector<std::uint8_t>, std::string> load_image_bytes(
    const domain::ImageRef& ref) {
  using R = core::Result<std::vector<std::uint8_t>, std::string>;

  if (!ref.valid()) {
    return R::err("image must carry exactly one of encoded bytes or a file path");
  }
  if (!ref.bytes.empty()) {
    return R::ok(ref.bytes);
  }

  std::ifstream file(ref.path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    return R::err("failed to open image file: " + ref.path);
  }

  const auto size = file.tellg();
  if (size <= 0) {
    return R::err("image file is empty: " + ref.path);
  }
  file.seekg(0, std::ios::beg);

  std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
  if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
    return R::err("failed to read image file: " + ref.path);
  }
  return R::ok(std::move(data));
}

core::Result<cv::Mat, std::string> decode_image(const std::vector<std::uint8_t>& bytes) {
  using R = core::Result<cv::Mat, std::string>;

  if (bytes.empty()) {
    return R::err("image data is empty");
  }

  cv::Mat decoded;
  try {
    decoded = cv::imdecode(bytes, cv::IMREAD_GRAYSCALE);
  } catch (const cv::Exception& e) {
    return R::err(std::string("image decoding failed: ") + e.what());
  }
  if (decoded.empty()) {
    return R::err("image data is not in a supported format");
  }
  return R::ok(decoded);
}

std::string image_cache_key(const std::vector<std::uint8_t>& bytes,
                            const std::string_view algorithm) {
  std::string material;
  material.reserve(algorithm.size() + bytes.size() + 1);
  material.append(algorithm);
  material += ':';
  material.append(bytes.begin(), bytes.end());
  return core::stable_hash64_hex(material);
}

std::string AverageHasher::algorithm() const {
  return "ahash" + std::to_string(grid_) + "-v1";
}

core::Result<domain::PerceptualHash, std::string> AverageHasher::hash(
    const cv::Mat& image) const {
  using R = core::Result<domain::PerceptualHash, std::string>;

  auto gray = to_gray(image, grid_);
  if (!gray.has_value()) {
    return R::err(gray.error());
  }

  const int side = static_cast<int>(grid_);
  cv::Mat resized;
  cv::resize(gray.value(), resized, cv::Size(side, side), 0, 0, cv::INTER_AREA);
  const double mean = cv::mean(resized)[0];

  auto result = domain::PerceptualHash::zeros(grid_ * grid_, algorithm());
  for (int row = 0; row < side; ++row) {
    for (int col = 0; col < side; ++col) {
      result.set_bit(static_cast<std::size_t>(row * side + col),
                     resized.at<std::uint8_t>(row, col) > mean);
    }
  }
  return R::ok(std::move(result));
}

std::string DifferenceHasher::algorithm() const {
  return "dhash" + std::to_string(grid_) + "-v1";
}

core::Result<domain::PerceptualHash, std::string> DifferenceHasher::hash(
    const cv::Mat& image) const {
  using R = core::Result<domain::PerceptualHash, std::string>;

  auto gray = to_gray(image, grid_);
  if (!gray.has_value()) {
    return R::err(gray.error());
  }

  const int side = static_cast<int>(grid_);
  cv::Mat resized;
  cv::resize(gray.value(), resized, cv::Size(side + 1, side), 0, 0, cv::INTER_AREA);

  auto result = domain::PerceptualHash::zeros(grid_ * grid_, algorithm());
  for (int row = 0; row < side; ++row) {
    for (int col = 0; col < side; ++col) {
      const auto left = resized.at<std::uint8_t>(row, col);
      const auto right = resized.at<std::uint8_t>(row, col + 1);
      result.set_bit(static_cast<std::size_t>(row * side + col), left > right);
    }
  }
  return R::ok(std::move(result));
}

std::string_view hash_algorithm_to_string(const HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::kDifference:
      return "dhash";
    case HashAlgorithm::kAverage:
      return "ahash";
  }
  return "unknown";
}

std::optional<HashAlgorithm> hash_algorithm_from_string(const std::string_view value) {
  if (value == "dhash") {
    return HashAlgorithm::kDifference;
  }
  if (value == "ahash") {
    return HashAlgorithm::kAverage;
  }
  return std::nullopt;
}

std::unique_ptr<IPerceptualHasher> make_hasher(const HashAlgorithm algorithm,
                                               const std::size_t grid) {
  switch (algorithm) {
    case HashAlgorithm::kAverage:
      return std::make_unique<AverageHasher>(grid);
    case HashAlgorithm::kDifference:
      return std::make_unique<DifferenceHasher>(grid);
  }
  return std::make_unique<DifferenceHasher>(grid);
}

}  // namespace spme::similarity
