#pragma once

#include <string>
#include <string_view>

namespace spme::core {

// Minimal UTF-8 utilities for product-name processing.
// Similarity measures operate on code points, never on bytes, so a Chinese
// character counts as one symbol exactly like an ASCII letter.

// decode_utf8 converts UTF-8 to code points. Invalid, truncated, overlong and
// surrogate sequences are dropped (never replaced), so output is always valid.
// A lead byte missing its continuation bytes drops only that byte.
[[nodiscard]] std::u32string decode_utf8(std::string_view input);

// encode_utf8 converts code points back to UTF-8. Code points outside the
// Unicode range or in the surrogate block are skipped.
[[nodiscard]] std::string encode_utf8(std::u32string_view input);

void append_utf8(std::string& out, char32_t cp);

// is_letter_cp reports whether cp is a letter in one of the scripts seen in
// supplier listings: Latin (incl. extensions), Greek, Cyrillic, Armenian, Hebrew,
// Arabic, Thai, Hangul, Kana, Bopomofo and CJK ideographs (BMP + extension planes).
[[nodiscard]] bool is_letter_cp(char32_t cp);

// is_digit_cp reports ASCII digits plus Arabic-Indic and Devanagari digits.
[[nodiscard]] bool is_digit_cp(char32_t cp);

// fold_fullwidth maps fullwidth ASCII variants (U+FF01..U+FF5E) to ASCII.
// Other code points are returned unchanged.
[[nodiscard]] constexpr char32_t fold_fullwidth(const char32_t cp) {
  constexpr char32_t kFullwidthFirst = 0xFF01;
  constexpr char32_t kFullwidthLast = 0xFF5E;
  constexpr char32_t kFullwidthOffset = 0xFEE0;
  if (cp >= kFullwidthFirst && cp <= kFullwidthLast) {
    return cp - kFullwidthOffset;
  }
  return cp;
}

}  // namespace spme::core
