#include "spme/core/utf8.h"

#include <array>
#include <utility>

namespace spme::core {

namespace {

constexpr char32_t kMaxCodePoint = 0x10FFFF;
constexpr char32_t kSurrogateFirst = 0xD800;
constexpr char32_t kSurrogateLast = 0xDFFF;

bool is_continuation(const unsigned char byte) {
  return (byte & 0xC0U) == 0x80U;
}

// Inclusive code point ranges treated as letters. Sorted by first element.
constexpr std::array<std::pair<char32_t, char32_t>, 40> kLetterRanges{{
    {0x0041, 0x005A},    // Basic Latin uppercase
    {0x0061, 0x007A},    // Basic Latin lowercase
    {0x00AA, 0x00AA},    // feminine ordinal
    {0x00B5, 0x00B5},    // micro sign
    {0x00BA, 0x00BA},    // masculine ordinal
    {0x00C0, 0x00D6},    // Latin-1 letters
    {0x00D8, 0x00F6},    //
    {0x00F8, 0x024F},    // Latin-1 tail, Latin Extended-A/B
    {0x0250, 0x02AF},    // IPA extensions
    {0x0370, 0x0373},    // Greek
    {0x0376, 0x0377},    //
    {0x037B, 0x037D},    //
    {0x0386, 0x0386},    //
    {0x0388, 0x03FF},    //
    {0x0400, 0x0481},    // Cyrillic
    {0x048A, 0x052F},    //
    {0x0531, 0x0556},    // Armenian
    {0x0561, 0x0587},    //
    {0x05D0, 0x05EA},    // Hebrew
    {0x0620, 0x064A},    // Arabic
    {0x0E01, 0x0E30},    // Thai
    {0x1100, 0x11FF},    // Hangul Jamo
    {0x1E00, 0x1FFF},    // Latin Extended Additional, Greek Extended
    {0x3005, 0x3007},    // ideographic iteration mark, closing mark, number zero
    {0x3041, 0x3096},    // Hiragana
    {0x30A1, 0x30FA},    // Katakana
    {0x30FC, 0x30FF},    //
    {0x3105, 0x312F},    // Bopomofo
    {0x3131, 0x318E},    // Hangul compatibility Jamo
    {0x3400, 0x4DBF},    // CJK Extension A
    {0x4E00, 0x9FFF},    // CJK Unified Ideographs
    {0xAC00, 0xD7A3},    // Hangul syllables
    {0xF900, 0xFAFF},    // CJK compatibility ideographs
    {0xFF21, 0xFF3A},    // fullwidth Latin uppercase
    {0xFF41, 0xFF5A},    // fullwidth Latin lowercase
    {0xFF66, 0xFF9F},    // halfwidth Katakana
    {0x20000, 0x2A6DF},  // CJK Extension B
    {0x2A700, 0x2EBEF},  // CJK Extensions C-F
    {0x2F800, 0x2FA1F},  // CJK compatibility supplement
    {0x30000, 0x3134F},  // CJK Extension G
}};

}  // namespace

std::u32string decode_utf8(const std::string_view input) {
  std::u32string out;
  out.reserve(input.size());

  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);

    if (lead < 0x80U) {
      out.push_back(static_cast<char32_t>(lead));
      ++i;
      continue;
    }

    std::size_t len = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((lead & 0xE0U) == 0xC0U) {
      len = 2;
      cp = lead & 0x1FU;
      min_cp = 0x80;
    } else if ((lead & 0xF0U) == 0xE0U) {
      len = 3;
      cp = lead & 0x0FU;
      min_cp = 0x800;
    } else if ((lead & 0xF8U) == 0xF0U) {
      len = 4;
      cp = lead & 0x07U;
      min_cp = 0x10000;
    } else {
      // Stray continuation byte or invalid lead byte.
      ++i;
      continue;
    }

    // A short or broken sequence drops only its lead byte; whatever follows is
    // decoded on its own.
    bool valid = true;
    for (std::size_t k = 1; k < len; ++k) {
      if (i + k >= input.size()) {
        valid = false;
        break;
      }
      const auto byte = static_cast<unsigned char>(input[i + k]);
      if (!is_continuation(byte)) {
        valid = false;
        break;
      }
      cp = (cp << 6U) | (byte & 0x3FU);
    }

    if (!valid) {
      ++i;
      continue;
    }

    i += len;
    if (cp < min_cp || cp > kMaxCodePoint || (cp >= kSurrogateFirst && cp <= kSurrogateLast)) {
      continue;
    }
    out.push_back(cp);
  }

  return out;
}

void append_utf8(std::string& out, const char32_t cp) {
  if (cp > kMaxCodePoint || (cp >= kSurrogateFirst && cp <= kSurrogateLast)) {
    return;
  }
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::string encode_utf8(const std::u32string_view input) {
  std::string out;
  out.reserve(input.size() * 3);
  for (const char32_t cp : input) {
    append_utf8(out, cp);
  }
  return out;
}

bool is_letter_cp(const char32_t cp) {
  for (const auto& [first, last] : kLetterRanges) {
    if (cp < first) {
      return false;  // ranges are sorted
    }
    if (cp <= last) {
      return true;
    }
  }
  return false;
}

bool is_digit_cp(const char32_t cp) {
  return (cp >= U'0' && cp <= U'9') ||  // ASCII
         (cp >= 0x0660 && cp <= 0x0669) ||  // Arabic-Indic
         (cp >= 0x06F0 && cp <= 0x06F9) ||  // Extended Arabic-Indic
         (cp >= 0x0966 && cp <= 0x096F);    // Devanagari
}

}  // namespace spme::core
