#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace spme::core {

// Deterministic content hashing used for memoization keys (feature cache) and
// audit payload fingerprints. Not a cryptographic hash.
std::uint64_t stable_hash64(std::string_view input);
std::string stable_hash64_hex(std::string_view input);

}  // namespace spme::core
