#pragma once

#include <string>
#include <string_view>

namespace spme::core {

// Product-name normalization.
//
// normalize_product_name produces the canonical string that every similarity
// measure compares:
// - UTF-8 is decoded; invalid byte sequences are dropped
// - fullwidth ASCII variants fold to ASCII first ("２．４Ｇ" == "2.4G")
// - letters of any script and digits are kept; punctuation, symbols and ALL
//   whitespace are removed
// - ASCII A-Z is lowercased via explicit char math (no locale); caseless scripts
//   are left unchanged
// - optionally, the Chinese function characters 的 了 和 与 或 及 are stripped
//
// The function is deterministic and idempotent:
//   normalize_product_name(normalize_product_name(x)) == normalize_product_name(x)
// Empty or whitespace-only input yields "" (a valid value, not an error).

struct NormalizerOptions {
  bool strip_noise_words{false};

  // Version tag folded into feature-cache keys; bump when normalization output changes.
  static constexpr std::string_view kVersion = "norm-v1";
};

[[nodiscard]] std::string normalize_product_name(std::string_view name,
                                                 const NormalizerOptions& options = {});

// cache_key_for_name returns the memoization key of a name under the given options.
[[nodiscard]] std::string cache_key_for_name(std::string_view name,
                                             const NormalizerOptions& options);

// trim removes leading and trailing ASCII whitespace (space/tab/newline/CR).
inline std::string trim(const std::string_view input) {
  const auto is_ws = [](const char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
  };

  std::size_t start = 0;
  while (start < input.size() && is_ws(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ws(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace spme::core
