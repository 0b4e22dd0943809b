#include "spme/domain/raw_product.h"

#include "spme/core/normalization.h"

#include <cmath>

namespace spme::domain {

core::Result<bool, std::string> RawProduct::validate() const {
  if (core::trim(product_id.value).empty()) {
    return core::Result<bool, std::string>::err("product_id must not be empty");
  }

  if (core::trim(supplier_id.value).empty()) {
    return core::Result<bool, std::string>::err("supplier_id must not be empty");
  }

  // A whitespace-only name is a valid (empty after normalization) name; a missing one is not.
  if (name.empty()) {
    return core::Result<bool, std::string>::err("name must not be empty");
  }

  if (!std::isfinite(price.amount)) {
    return core::Result<bool, std::string>::err("price must be a finite number");
  }

  if (price.amount < 0.0) {
    return core::Result<bool, std::string>::err("price must not be negative");
  }

  if (image.has_value() && !image->valid()) {
    return core::Result<bool, std::string>::err(
        "image must carry exactly one of encoded bytes or a file path");
  }

  return core::Result<bool, std::string>::ok(true);
}

}  // namespace spme::domain
