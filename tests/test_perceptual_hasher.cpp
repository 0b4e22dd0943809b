#include "spme/similarity/image_similarity.h"
#include "spme/similarity/perceptual_hasher.h"

#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace spme;

namespace {

cv::Mat uniform_image(int width, int height, std::uint8_t value) {
  return cv::Mat(height, width, CV_8UC1, cv::Scalar(value));
}

// Brightness falls off left to right: every cell is brighter than its right neighbour.
cv::Mat falling_gradient(int offset) {
  cv::Mat image(8, 90, CV_8UC1);
  for (int y = 0; y < image.rows; ++y) {
    for (int x = 0; x < image.cols; ++x) {
      image.at<std::uint8_t>(y, x) = static_cast<std::uint8_t>(200 - 2 * x + offset);
    }
  }
  return image;
}

std::vector<std::uint8_t> encode_png(const cv::Mat& image) {
  std::vector<std::uint8_t> bytes;
  REQUIRE(cv::imencode(".png", image, bytes));
  return bytes;
}

std::size_t popcount(const domain::PerceptualHash& hash) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < hash.bit_length; ++i) {
    count += hash.bit(i) ? 1 : 0;
  }
  return count;
}

}  // namespace

TEST_CASE("hashers reject unusable input", "[similarity][hasher]") {
  const similarity::DifferenceHasher dhash;
  const similarity::AverageHasher ahash;

  const cv::Mat empty;
  CHECK_FALSE(dhash.hash(empty).has_value());
  CHECK_FALSE(ahash.hash(empty).has_value());

  const cv::Mat floating(4, 4, CV_32FC1, cv::Scalar(0.5));
  CHECK_FALSE(dhash.hash(floating).has_value());

  const similarity::DifferenceHasher too_fine(65);
  CHECK_FALSE(too_fine.hash(uniform_image(4, 4, 10)).has_value());
}

TEST_CASE("hash bit patterns", "[similarity][hasher]") {
  SECTION("uniform image hashes to zeros under both algorithms") {
    const auto image = uniform_image(32, 32, 128);
    const auto d = similarity::DifferenceHasher{}.hash(image);
    const auto a = similarity::AverageHasher{}.hash(image);
    REQUIRE(d.has_value());
    REQUIRE(a.has_value());
    CHECK(popcount(d.value()) == 0);
    CHECK(popcount(a.value()) == 0);
  }

  SECTION("falling gradient sets every dHash bit") {
    const auto d = similarity::DifferenceHasher{}.hash(falling_gradient(0));
    REQUIRE(d.has_value());
    CHECK(d.value().bit_length == 64);
    CHECK(popcount(d.value()) == 64);
  }

  SECTION("half dark, half bright sets half the aHash bits") {
    cv::Mat image = uniform_image(16, 16, 0);
    image(cv::Rect(8, 0, 8, 16)).setTo(cv::Scalar(255));
    const auto a = similarity::AverageHasher{}.hash(image);
    REQUIRE(a.has_value());
    CHECK(popcount(a.value()) == 32);
    CHECK(a.value().bit(7));
    CHECK_FALSE(a.value().bit(0));
  }

  SECTION("colour input is converted to gray") {
    const cv::Mat bgr(32, 32, CV_8UC3, cv::Scalar(40, 90, 200));
    const auto d = similarity::DifferenceHasher{}.hash(bgr);
    REQUIRE(d.has_value());
    CHECK(popcount(d.value()) == 0);
  }

  SECTION("grid size controls the bit length") {
    const auto d = similarity::DifferenceHasher{16}.hash(uniform_image(40, 40, 3));
    REQUIRE(d.has_value());
    CHECK(d.value().bit_length == 256);
    CHECK(d.value().algorithm == "dhash16-v1");
  }
}

TEST_CASE("dHash tolerates a uniform brightness shift", "[similarity][hasher]") {
  const similarity::DifferenceHasher dhash;
  const auto base = dhash.hash(falling_gradient(0));
  const auto brighter = dhash.hash(falling_gradient(30));
  REQUIRE(base.has_value());
  REQUIRE(brighter.has_value());

  const auto s = similarity::image_similarity(base.value(), brighter.value());
  REQUIRE(s.has_value());
  CHECK(s.value() == 1.0);
}

TEST_CASE("hasher factory and tags", "[similarity][hasher]") {
  CHECK(similarity::make_hasher(similarity::HashAlgorithm::kDifference)->algorithm() ==
        "dhash8-v1");
  CHECK(similarity::make_hasher(similarity::HashAlgorithm::kAverage, 4)->algorithm() ==
        "ahash4-v1");

  CHECK(similarity::hash_algorithm_from_string("ahash") == similarity::HashAlgorithm::kAverage);
  CHECK(similarity::hash_algorithm_from_string("phash") == std::nullopt);
  CHECK(similarity::hash_algorithm_to_string(similarity::HashAlgorithm::kDifference) == "dhash");
}

TEST_CASE("encoded images are decoded before hashing", "[similarity][hasher][decode]") {
  const auto gradient = falling_gradient(0);
  const auto bytes = encode_png(gradient);

  SECTION("decoded PNG hashes like the source raster") {
    const auto decoded = similarity::decode_image(bytes);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value().cols == 90);
    CHECK(decoded.value().rows == 8);
    CHECK(decoded.value().channels() == 1);

    const similarity::DifferenceHasher dhash;
    CHECK(dhash.hash(decoded.value()).value() == dhash.hash(gradient).value());
  }

  SECTION("garbage and empty buffers are rejected") {
    CHECK_FALSE(similarity::decode_image({0x01, 0x02, 0x03, 0x04}).has_value());
    CHECK_FALSE(similarity::decode_image({}).has_value());
  }

  SECTION("bytes are read from a file path") {
    const auto path = std::filesystem::temp_directory_path() / "spme_hasher_test.png";
    {
      std::ofstream out(path, std::ios::binary);
      out.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
    }

    domain::ImageRef ref;
    ref.path = path.string();
    const auto loaded = similarity::load_image_bytes(ref);
    REQUIRE(loaded.has_value());
    CHECK(loaded.value() == bytes);

    std::filesystem::remove(path);
  }

  SECTION("missing files and empty references fail") {
    domain::ImageRef missing;
    missing.path = "/nonexistent/spme/photo.png";
    CHECK_FALSE(similarity::load_image_bytes(missing).has_value());
    CHECK_FALSE(similarity::load_image_bytes(domain::ImageRef{}).has_value());
  }
}

TEST_CASE("image_cache_key identifies content and algorithm", "[similarity][hasher][cache]") {
  const std::vector<std::uint8_t> a{1, 2, 3, 4};
  const std::vector<std::uint8_t> b{1, 2, 3, 5};

  CHECK(similarity::image_cache_key(a, "dhash8-v1") == similarity::image_cache_key(a, "dhash8-v1"));
  CHECK(similarity::image_cache_key(a, "dhash8-v1") != similarity::image_cache_key(b, "dhash8-v1"));
  CHECK(similarity::image_cache_key(a, "dhash8-v1") != similarity::image_cache_key(a, "ahash8-v1"));
}
