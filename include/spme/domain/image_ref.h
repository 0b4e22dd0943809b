#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace spme::domain {

// ImageRef points at a product photo as handed over by the import layer:
// either the encoded file content (JPEG/PNG/WebP/...) or a local file path.
// Exactly one of the two is set.
struct ImageRef {
  std::vector<std::uint8_t> bytes;
  std::string path;

  [[nodiscard]] bool valid() const { return bytes.empty() != path.empty(); }
};

}  // namespace spme::domain
