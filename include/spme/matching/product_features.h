#pragma once

#include "spme/core/ids.h"
#include "spme/domain/perceptual_hash.h"

#include <optional>
#include <string>

namespace spme::matching {

// ProductFeatures are the values derived from one RawProduct before scoring.
// They are returned to the caller so they can be persisted and fed back in
// (normalized_name / image_hash on RawProduct) to skip recomputation.
struct ProductFeatures {
  core::ProductId product_id;
  std::string normalized_name;
  std::optional<domain::PerceptualHash> image_hash;  // usable (non-empty) hash only
  bool name_from_cache{false};
  bool hash_from_cache{false};
};

}  // namespace spme::matching
