#pragma once

#include <cstddef>
#include <string_view>

namespace spme::similarity {

// levenshtein_distance counts single code point insertions, deletions and
// substitutions needed to turn a into b.
[[nodiscard]] std::size_t levenshtein_distance(std::u32string_view a, std::u32string_view b);

}  // namespace spme::similarity
