#include "spme/core/normalization.h"

#include "spme/core/hashing.h"
#include "spme/core/utf8.h"

#include <array>

namespace spme::core {

namespace {

// 的 了 和 与 或 及
constexpr std::array<char32_t, 6> kNoiseCharacters{0x7684, 0x4E86, 0x548C, 0x4E0E, 0x6216, 0x53CA};

bool is_noise_character(const char32_t cp) {
  for (const char32_t noise : kNoiseCharacters) {
    if (cp == noise) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string normalize_product_name(const std::string_view name, const NormalizerOptions& options) {
  const std::u32string code_points = decode_utf8(name);

  std::string out;
  out.reserve(name.size());

  for (const char32_t raw : code_points) {
    char32_t cp = fold_fullwidth(raw);

    if (!is_letter_cp(cp) && !is_digit_cp(cp)) {
      continue;
    }
    if (options.strip_noise_words && is_noise_character(cp)) {
      continue;
    }
    if (cp >= U'A' && cp <= U'Z') {
      cp = cp - U'A' + U'a';
    }
    append_utf8(out, cp);
  }

  return out;
}

std::string cache_key_for_name(const std::string_view name, const NormalizerOptions& options) {
  std::string material{NormalizerOptions::kVersion};
  material += options.strip_noise_words ? ":strip-noise:" : ":keep-noise:";
  material.append(name);
  return stable_hash64_hex(material);
}

}  // namespace spme::core
