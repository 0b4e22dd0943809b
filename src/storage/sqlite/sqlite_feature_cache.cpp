#include "spme/storage/sqlite/sqlite_feature_cache.h"

#include <sqlite3.h>

#include <iostream>

namespace spme::storage::sqlite {

SqliteFeatureCache::SqliteFeatureCache(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

std::optional<std::string> SqliteFeatureCache::get_normalized_name(const std::string& key) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT normalized_name FROM normalized_names WHERE cache_key = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return column_text(stmt.get(), 0);
}

void SqliteFeatureCache::put_normalized_name(const std::string& key,
                                             const std::string& normalized) {
  PreparedStatement stmt(db_->connection(),
                         "INSERT OR REPLACE INTO normalized_names (cache_key, normalized_name) "
                         "VALUES (?, ?)");
  if (!stmt.is_valid()) {
    std::cerr << "feature cache: prepare failed: " << stmt.error() << "\n";
    return;
  }

  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, normalized.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "feature cache: name insert failed: " << sqlite3_errmsg(db_->connection())
              << "\n";
  }
}

std::optional<domain::PerceptualHash> SqliteFeatureCache::get_image_hash(
    const std::string& key) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT algorithm, bit_length, hash_hex FROM image_hashes "
                         "WHERE cache_key = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  const std::string algorithm = column_text(stmt.get(), 0);
  const auto bit_length = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 1));
  auto parsed = domain::PerceptualHash::from_hex(column_text(stmt.get(), 2), algorithm);
  if (!parsed.has_value() || parsed.value().bit_length < bit_length) {
    // A corrupt row is a miss; the engine recomputes and overwrites it.
    return std::nullopt;
  }

  // from_hex rounds up to whole digits; restore the stored length.
  auto hash = parsed.take_value();
  hash.bit_length = bit_length;
  return hash;
}

void SqliteFeatureCache::put_image_hash(const std::string& key,
                                        const domain::PerceptualHash& hash) {
  PreparedStatement stmt(db_->connection(),
                         "INSERT OR REPLACE INTO image_hashes "
                         "(cache_key, algorithm, bit_length, hash_hex) VALUES (?, ?, ?, ?)");
  if (!stmt.is_valid()) {
    std::cerr << "feature cache: prepare failed: " << stmt.error() << "\n";
    return;
  }

  const std::string hex = hash.to_hex();
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, hash.algorithm.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(hash.bit_length));
  sqlite3_bind_text(stmt.get(), 4, hex.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "feature cache: hash insert failed: " << sqlite3_errmsg(db_->connection())
              << "\n";
  }
}

}  // namespace spme::storage::sqlite
