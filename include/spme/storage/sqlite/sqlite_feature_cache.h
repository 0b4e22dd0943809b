#pragma once

#include "spme/storage/feature_cache.h"
#include "spme/storage/sqlite/sqlite_db.h"

#include <memory>

namespace spme::storage::sqlite {

// SqliteFeatureCache persists normalized names and perceptual hashes so that
// repeated runs over a mostly unchanged catalogue skip recomputation.
// Hashes are stored as hex plus bit length and algorithm tag.
// Requires schema v2.
class SqliteFeatureCache final : public IFeatureCache {
 public:
  explicit SqliteFeatureCache(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] std::optional<std::string> get_normalized_name(
      const std::string& key) const override;
  void put_normalized_name(const std::string& key, const std::string& normalized) override;

  [[nodiscard]] std::optional<domain::PerceptualHash> get_image_hash(
      const std::string& key) const override;
  void put_image_hash(const std::string& key, const domain::PerceptualHash& hash) override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace spme::storage::sqlite
