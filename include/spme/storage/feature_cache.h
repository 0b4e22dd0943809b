#pragma once

#include "spme/domain/perceptual_hash.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace spme::storage {

// IFeatureCache memoizes derived product features across runs.
// Keys are content hashes of the input (see core::cache_key_for_name and
// similarity::image_cache_key), so a changed name or image never hits a stale
// entry. The cache is owned by the caller; the engine only reads and fills it.
class IFeatureCache {
 public:
  virtual ~IFeatureCache() = default;

  [[nodiscard]] virtual std::optional<std::string> get_normalized_name(
      const std::string& key) const = 0;
  virtual void put_normalized_name(const std::string& key, const std::string& normalized) = 0;

  [[nodiscard]] virtual std::optional<domain::PerceptualHash> get_image_hash(
      const std::string& key) const = 0;
  virtual void put_image_hash(const std::string& key, const domain::PerceptualHash& hash) = 0;
};

class InMemoryFeatureCache final : public IFeatureCache {
 public:
  [[nodiscard]] std::optional<std::string> get_normalized_name(
      const std::string& key) const override;
  void put_normalized_name(const std::string& key, const std::string& normalized) override;

  [[nodiscard]] std::optional<domain::PerceptualHash> get_image_hash(
      const std::string& key) const override;
  void put_image_hash(const std::string& key, const domain::PerceptualHash& hash) override;

  [[nodiscard]] std::size_t name_count() const { return names_.size(); }
  [[nodiscard]] std::size_t hash_count() const { return hashes_.size(); }

 private:
  std::map<std::string, std::string> names_;
  std::map<std::string, domain::PerceptualHash> hashes_;
};

}  // namespace spme::storage
