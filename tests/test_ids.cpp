#include "spme/core/hashing.h"
#include "spme/core/id_generator.h"
#include "spme/core/ids.h"

#include <catch2/catch_test_macros.hpp>

#include <set>

using namespace spme;

TEST_CASE("deterministic id generator is sequential across prefixes", "[core][ids]") {
  core::DeterministicIdGenerator gen;
  CHECK(core::new_trace_id(gen).value == "trace-0");
  CHECK(gen.next("evt") == "evt-1");
  CHECK(gen.next("evt") == "evt-2");
}

TEST_CASE("system id generator yields unique prefixed ids", "[core][ids]") {
  core::SystemIdGenerator gen;
  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {
    const auto id = gen.next("trace");
    CHECK(id.rfind("trace-", 0) == 0);
    ids.insert(id);
  }
  CHECK(ids.size() == 100);
}

TEST_CASE("strong ids compare by value", "[core][ids]") {
  CHECK(core::ProductId{"a"} < core::ProductId{"b"});
  CHECK(core::SupplierId{"s1"} == core::SupplierId{"s1"});
  CHECK(core::GroupId{"group-10"} < core::GroupId{"group-2"});
}

TEST_CASE("stable_hash64 is deterministic", "[core][hashing]") {
  CHECK(core::stable_hash64("无线鼠标") == core::stable_hash64("无线鼠标"));
  CHECK(core::stable_hash64("a") != core::stable_hash64("b"));
  CHECK(core::stable_hash64_hex("a").size() == 16);
}
