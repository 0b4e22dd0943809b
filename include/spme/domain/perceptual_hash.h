#pragma once

#include "spme/core/result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace spme::domain {

// PerceptualHash is a fixed-length bit vector summarizing an image's coarse
// structure. Bits are packed little-endian into 64-bit words: bit i lives in
// words[i / 64] at position i % 64. Bits beyond bit_length are always zero.
//
// algorithm identifies the hash function and its version (e.g. "dhash8-v1").
// Two hashes are comparable only if bit_length matches and, when both tags are
// set, the tags match. An empty tag matches any tag of the same length; the
// engine reports such hashes with a kUntaggedImageHash warning.
struct PerceptualHash {
  std::size_t bit_length{0};
  std::vector<std::uint64_t> words;
  std::string algorithm;

  bool operator==(const PerceptualHash&) const = default;

  [[nodiscard]] bool empty() const { return bit_length == 0; }
  [[nodiscard]] bool bit(std::size_t index) const;
  void set_bit(std::size_t index, bool value);

  // Allocates a zeroed hash of the given length.
  [[nodiscard]] static PerceptualHash zeros(std::size_t bit_length, std::string algorithm = {});

  // from_u64 wraps a classic 64-bit hash value.
  [[nodiscard]] static PerceptualHash from_u64(std::uint64_t value, std::string algorithm = {});

  // from_hex parses a big-endian hex string ("ff00..."); bit_length = 4 * digits.
  // Rejects empty strings and non-hex characters.
  [[nodiscard]] static core::Result<PerceptualHash, std::string> from_hex(
      std::string_view hex, std::string algorithm = {});

  // to_hex renders the hash as big-endian lowercase hex, ceil(bit_length / 4) digits.
  [[nodiscard]] std::string to_hex() const;
};

}  // namespace spme::domain
