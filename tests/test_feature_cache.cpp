#include "spme/storage/feature_cache.h"
#include "spme/storage/sqlite/sqlite_db.h"
#include "spme/storage/sqlite/sqlite_feature_cache.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

using namespace spme;

TEST_CASE("InMemoryFeatureCache stores names and hashes", "[storage][cache]") {
  storage::InMemoryFeatureCache cache;
  CHECK_FALSE(cache.get_normalized_name("k1").has_value());
  CHECK_FALSE(cache.get_image_hash("h1").has_value());

  cache.put_normalized_name("k1", "无线鼠标24g");
  cache.put_image_hash("h1", domain::PerceptualHash::from_u64(0xABCD, "dhash8-v1"));

  CHECK(cache.get_normalized_name("k1") == std::optional<std::string>{"无线鼠标24g"});
  const auto hash = cache.get_image_hash("h1");
  REQUIRE(hash.has_value());
  CHECK(hash->words[0] == 0xABCD);
  CHECK(hash->algorithm == "dhash8-v1");
  CHECK(cache.name_count() == 1);
  CHECK(cache.hash_count() == 1);

  SECTION("put replaces an existing entry") {
    cache.put_normalized_name("k1", "other");
    CHECK(cache.get_normalized_name("k1") == std::optional<std::string>{"other"});
    CHECK(cache.name_count() == 1);
  }
}

TEST_CASE("SqliteFeatureCache round-trips entries", "[sqlite][cache]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v2().has_value());
  CHECK(db->get_schema_version() == 2);

  storage::sqlite::SqliteFeatureCache cache(db);
  CHECK_FALSE(cache.get_normalized_name("missing").has_value());
  CHECK_FALSE(cache.get_image_hash("missing").has_value());

  cache.put_normalized_name("k1", "蓝牙耳机");
  CHECK(cache.get_normalized_name("k1") == std::optional<std::string>{"蓝牙耳机"});

  SECTION("64-bit hash") {
    const auto original = domain::PerceptualHash::from_u64(0xF0F0F0F00F0F0F0FULL, "ahash8-v1");
    cache.put_image_hash("h1", original);
    const auto loaded = cache.get_image_hash("h1");
    REQUIRE(loaded.has_value());
    CHECK(loaded.value() == original);
  }

  SECTION("bit length that is not a whole number of hex digits") {
    auto original = domain::PerceptualHash::zeros(9, "dhash3-v1");
    original.set_bit(0, true);
    original.set_bit(8, true);
    cache.put_image_hash("h2", original);
    const auto loaded = cache.get_image_hash("h2");
    REQUIRE(loaded.has_value());
    CHECK(loaded->bit_length == 9);
    CHECK(loaded->bit(0));
    CHECK(loaded->bit(8));
    CHECK(loaded->algorithm == "dhash3-v1");
  }

  SECTION("corrupt rows read as misses") {
    REQUIRE(db->exec("INSERT INTO image_hashes (cache_key, algorithm, bit_length, hash_hex) "
                     "VALUES ('bad', 'dhash8-v1', 64, 'zz')")
                .has_value());
    CHECK_FALSE(cache.get_image_hash("bad").has_value());
  }
}

TEST_CASE("schema migrations are idempotent", "[sqlite][schema]") {
  auto db_result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  CHECK(db->get_schema_version() == 0);

  REQUIRE(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
  REQUIRE(db->ensure_schema_v2().has_value());
  REQUIRE(db->ensure_schema_v2().has_value());
  CHECK(db->get_schema_version() == 2);
}

TEST_CASE("SqliteFeatureCache persists across connections", "[sqlite][cache]") {
  const auto path = std::filesystem::temp_directory_path() / "spme_feature_cache_test.db";
  std::filesystem::remove(path);

  {
    auto db_result = storage::sqlite::SqliteDb::open(path.string());
    REQUIRE(db_result.has_value());
    REQUIRE(db_result.value()->ensure_schema_v2().has_value());
    storage::sqlite::SqliteFeatureCache cache(db_result.value());
    cache.put_normalized_name("k1", "机械键盘");
    cache.put_image_hash("h1", domain::PerceptualHash::from_u64(42, "dhash8-v1"));
  }

  {
    auto db_result = storage::sqlite::SqliteDb::open(path.string());
    REQUIRE(db_result.has_value());
    REQUIRE(db_result.value()->ensure_schema_v2().has_value());
    storage::sqlite::SqliteFeatureCache cache(db_result.value());
    CHECK(cache.get_normalized_name("k1") == std::optional<std::string>{"机械键盘"});
    const auto hash = cache.get_image_hash("h1");
    REQUIRE(hash.has_value());
    CHECK(hash->words[0] == 42);
  }

  std::filesystem::remove(path);
}
