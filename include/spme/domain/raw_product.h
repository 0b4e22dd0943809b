#pragma once

#include "spme/core/ids.h"
#include "spme/core/result.h"
#include "spme/domain/image_ref.h"
#include "spme/domain/money.h"
#include "spme/domain/perceptual_hash.h"

#include <optional>
#include <string>

namespace spme::domain {

// RawProduct is one listing from one supplier, as handed over by the import layer.
// The engine treats it as immutable for the duration of a run.
//
// Required: product_id, supplier_id, name, price (finite, >= 0).
// image_hash and image are alternative image references: a precomputed hash wins;
// an ImageRef is decoded and hashed by the configured hasher; neither means
// "no image signal".
// normalized_name is a caller-side cached value; when set it is trusted as-is.
struct RawProduct {
  core::ProductId product_id;
  core::SupplierId supplier_id;
  std::string name;
  Money price;
  std::string url;
  std::optional<std::string> english_name;
  std::optional<PerceptualHash> image_hash;
  std::optional<ImageRef> image;
  std::optional<std::string> normalized_name;

  // validate checks the required-field invariants.
  // Returns ok(true) if valid, err(message) naming the offending field otherwise.
  [[nodiscard]] core::Result<bool, std::string> validate() const;

  [[nodiscard]] bool has_image_reference() const {
    return image_hash.has_value() || image.has_value();
  }
};

}  // namespace spme::domain
