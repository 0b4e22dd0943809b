#include "spme/storage/feature_cache.h"

namespace spme::storage {

std::optional<std::string> InMemoryFeatureCache::get_normalized_name(
    const std::string& key) const {
  const auto it = names_.find(key);
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryFeatureCache::put_normalized_name(const std::string& key,
                                               const std::string& normalized) {
  names_[key] = normalized;
}

std::optional<domain::PerceptualHash> InMemoryFeatureCache::get_image_hash(
    const std::string& key) const {
  const auto it = hashes_.find(key);
  if (it == hashes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryFeatureCache::put_image_hash(const std::string& key,
                                          const domain::PerceptualHash& hash) {
  hashes_[key] = hash;
}

}  // namespace spme::storage
