#include "spme/domain/perceptual_hash.h"

namespace spme::domain {

namespace {

constexpr std::size_t kWordBits = 64;

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

bool PerceptualHash::bit(const std::size_t index) const {
  if (index >= bit_length || index / kWordBits >= words.size()) {
    return false;
  }
  return ((words[index / kWordBits] >> (index % kWordBits)) & 1ULL) != 0;
}

void PerceptualHash::set_bit(const std::size_t index, const bool value) {
  if (index >= bit_length) {
    return;
  }
  if (words.size() <= index / kWordBits) {
    words.resize(index / kWordBits + 1, 0);
  }
  const std::uint64_t mask = 1ULL << (index % kWordBits);
  if (value) {
    words[index / kWordBits] |= mask;
  } else {
    words[index / kWordBits] &= ~mask;
  }
}

PerceptualHash PerceptualHash::zeros(const std::size_t bit_length, std::string algorithm) {
  PerceptualHash hash;
  hash.bit_length = bit_length;
  hash.words.assign((bit_length + kWordBits - 1) / kWordBits, 0);
  hash.algorithm = std::move(algorithm);
  return hash;
}

PerceptualHash PerceptualHash::from_u64(const std::uint64_t value, std::string algorithm) {
  PerceptualHash hash = zeros(kWordBits, std::move(algorithm));
  hash.words[0] = value;
  return hash;
}

core::Result<PerceptualHash, std::string> PerceptualHash::from_hex(const std::string_view hex,
                                                                   std::string algorithm) {
  if (hex.empty()) {
    return core::Result<PerceptualHash, std::string>::err("perceptual hash must not be empty");
  }

  PerceptualHash hash = zeros(hex.size() * 4, std::move(algorithm));

  // The last hex digit holds bits 0..3.
  std::size_t bit_index = 0;
  for (auto it = hex.rbegin(); it != hex.rend(); ++it) {
    const int nibble = hex_value(*it);
    if (nibble < 0) {
      return core::Result<PerceptualHash, std::string>::err(
          "perceptual hash contains non-hex character '" + std::string(1, *it) + "'");
    }
    for (int b = 0; b < 4; ++b) {
      hash.set_bit(bit_index++, ((nibble >> b) & 1) != 0);
    }
  }

  return core::Result<PerceptualHash, std::string>::ok(std::move(hash));
}

std::string PerceptualHash::to_hex() const {
  constexpr const char* kDigits = "0123456789abcdef";
  const std::size_t digits = (bit_length + 3) / 4;

  std::string out(digits, '0');
  for (std::size_t d = 0; d < digits; ++d) {
    int nibble = 0;
    for (int b = 0; b < 4; ++b) {
      if (bit(d * 4 + static_cast<std::size_t>(b))) {
        nibble |= 1 << b;
      }
    }
    out[digits - 1 - d] = kDigits[nibble];
  }
  return out;
}

}  // namespace spme::domain
