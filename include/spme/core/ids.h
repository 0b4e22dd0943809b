#pragma once

#include "spme/core/id_generator.h"

#include <string>

namespace spme::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// These are "vocabulary types" that prevent ID confusion and enable type-safe APIs.
// Product and supplier ids are opaque to the engine; ordering is lexicographic on value.

struct ProductId {
  std::string value;
  auto operator<=>(const ProductId&) const = default;  // C++20: generates ==, !=, <, <=, >, >=
};

struct SupplierId {
  std::string value;
  auto operator<=>(const SupplierId&) const = default;
};

struct GroupId {
  std::string value;
  auto operator<=>(const GroupId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& gen) {
  return TraceId{gen.next("trace")};
}

}  // namespace spme::core
