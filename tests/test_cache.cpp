#include "simple_cache/cache.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace simple_cache;

namespace {
using StrCache = Cache<std::string, std::string>;

std::vector<std::string> key_list(const StrCache &c) {
  auto view = c.keys();
  return std::vector<std::string>(view.begin(), view.end());
}
} // namespace

TEST_CASE("set and get round a value", "[cache][basic]") {
  StrCache c;
  c.set("name", "shreedhar");
  auto v = c.get("name");
  REQUIRE(v.has_value());
  CHECK(*v == "shreedhar");
  CHECK(c.size() == 1);
}

TEST_CASE("never-set keys behave as absent", "[cache][absent]") {
  StrCache c;
  CHECK_FALSE(c.get("missing").has_value());
  CHECK_FALSE(c.has("missing"));
  CHECK(c.ttl("missing") == -2);
  CHECK_FALSE(c.expire("missing", 100));
  CHECK_FALSE(c.persist("missing"));
  CHECK_FALSE(c.del("missing"));
  CHECK_FALSE(c.del("missing"));
  CHECK(c.size() == 0);
}

TEST_CASE("delete and clear", "[cache][delete]") {
  StrCache c;
  c.set("key1", "value1");
  c.set("key2", "value2");
  REQUIRE(c.has("key1"));
  CHECK(c.del("key1"));
  CHECK_FALSE(c.has("key1"));
  CHECK_FALSE(c.del("key1"));
  CHECK(c.size() == 1);

  c.clear();
  CHECK(c.size() == 0);
  c.clear();
  CHECK(c.size() == 0);
  CHECK(key_list(c).empty());
}

TEST_CASE("keys follow insertion order and overwrite moves to the back",
          "[cache][keys]") {
  StrCache c;
  c.set("a", "1");
  c.set("b", "2");
  c.set("c", "3");
  CHECK(key_list(c) == std::vector<std::string>{"a", "b", "c"});

  c.set("a", "4");
  CHECK(key_list(c) == std::vector<std::string>{"b", "c", "a"});
  CHECK(*c.get("a") == "4");
  CHECK(c.size() == 3);

  // Every call walks from the start again.
  auto view = c.keys();
  CHECK(view.size() == 3);
  CHECK(std::vector<std::string>(view.begin(), view.end()) ==
        std::vector<std::string>(view.begin(), view.end()));
}

TEST_CASE("has does not change recency under lru", "[cache][keys]") {
  StrCache c({.capacity = 3, .eviction_policy = "lru"});
  c.set("a", "1");
  c.set("b", "2");
  REQUIRE(c.has("a"));
  CHECK(key_list(c) == std::vector<std::string>{"a", "b"});
  REQUIRE(c.get("a").has_value());
  CHECK(key_list(c) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("ttl sentinels and countdown", "[cache][ttl]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({}, clock);
  c.set("forever", "x");
  c.set("short", "y", 1000);

  CHECK(c.ttl("nope") == -2);
  CHECK(c.ttl("forever") == -1);
  CHECK(c.ttl("short") == 1000);

  clock->advance(400);
  const auto t1 = c.ttl("short");
  CHECK(t1 == 600);
  clock->advance(600);
  const auto t2 = c.ttl("short");
  CHECK(t2 == 0);
  CHECK(t2 <= t1);
  CHECK(c.has("short"));

  clock->advance(1);
  CHECK(c.ttl("short") == -2);
  CHECK(c.size() == 1);
}

TEST_CASE("expire and persist rewrite only the deadline", "[cache][ttl]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({.capacity = 3, .eviction_policy = "fifo"}, clock);
  c.set("a", "1");
  c.set("b", "2");

  REQUIRE(c.expire("a", 500));
  CHECK(c.ttl("a") == 500);
  CHECK(key_list(c) == std::vector<std::string>{"a", "b"});

  REQUIRE(c.persist("a"));
  CHECK(c.ttl("a") == -1);
  clock->advance(10000);
  CHECK(*c.get("a") == "1");

  REQUIRE(c.expire("b", 10));
  clock->advance(11);
  CHECK_FALSE(c.persist("b"));
  CHECK_FALSE(c.has("b"));
}

TEST_CASE("value expires strictly after its deadline", "[cache][ttl]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({.enable_stats = true}, clock);
  c.set("k", "v", 1000);
  CHECK(*c.get("k") == "v");

  clock->advance(1000);
  CHECK(c.get("k").has_value());

  clock->advance(1);
  CHECK_FALSE(c.get("k").has_value());
  CHECK(c.size() == 0);
  auto s = c.get_stats();
  CHECK(s.expires == 1);
  CHECK(s.misses == 1);
  CHECK(s.hits == 2);
}

TEST_CASE("default ttl applies unless overridden per entry", "[cache][ttl]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({.default_ttl_ms = 2000}, clock);
  c.set("a", "1");
  c.set("b", "2", 3000);
  CHECK(c.ttl("a") == 2000);
  CHECK(c.ttl("b") == 3000);

  clock->advance(2001);
  CHECK_FALSE(c.get("a").has_value());
  REQUIRE(c.get("b").has_value());
  CHECK(*c.get("b") == "2");
}

TEST_CASE("zero ttl lives until the clock moves", "[cache][ttl]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({}, clock);
  c.set("z", "0", 0);
  CHECK(c.ttl("z") == 0);
  CHECK(c.has("z"));
  clock->advance(1);
  CHECK_FALSE(c.has("z"));
}

TEST_CASE("stale entries count toward size until visited", "[cache][ttl]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({.enable_stats = true}, clock);
  c.set("a", "1", 10);
  c.set("b", "2", 10);
  c.set("c", "3");
  clock->advance(50);
  CHECK(c.size() == 3);
  CHECK(c.keys().size() == 3);

  CHECK_FALSE(c.has("a"));
  CHECK(c.size() == 2);
  CHECK(c.get_stats().expires == 1);
  CHECK(c.get_stats().misses == 0);

  CHECK_FALSE(c.del("b"));
  CHECK(c.get_stats().deletes == 0);
  CHECK(c.get_stats().expires == 2);
  CHECK(key_list(c) == std::vector<std::string>{"c"});
}

TEST_CASE("purge_expired sweeps eagerly and honours the limit",
          "[cache][ttl][purge]") {
  auto clock = std::make_shared<ManualClock>();
  StrCache c({.enable_stats = true}, clock);
  for (int i = 0; i < 6; ++i)
    c.set("t" + std::to_string(i), "v", 5);
  c.set("keep", "v");
  clock->advance(6);

  CHECK(c.purge_expired(4) == 4);
  CHECK(c.size() == 3);
  CHECK(c.purge_expired() == 2);
  CHECK(key_list(c) == std::vector<std::string>{"keep"});
  CHECK(c.get_stats().expires == 6);
  CHECK(c.purge_expired() == 0);
}

TEST_CASE("mget answers each key like get", "[cache][mget]") {
  StrCache c({.enable_stats = true});
  c.set("x", "1");
  c.set("y", "2");
  auto out = c.mget({"x", "nope", "y"});
  REQUIRE(out.size() == 3);
  CHECK(*out[0] == "1");
  CHECK_FALSE(out[1].has_value());
  CHECK(*out[2] == "2");
  CHECK(c.get_stats().hits == 2);
  CHECK(c.get_stats().misses == 1);
}

TEST_CASE("generic key and value types", "[cache][generic]") {
  Cache<int, std::vector<int>> c({.capacity = 2});
  c.set(1, {1, 2, 3});
  c.set(2, {4});
  c.set(3, {5, 6});
  CHECK_FALSE(c.has(1));
  auto v = c.get(3);
  REQUIRE(v.has_value());
  CHECK(v->size() == 2);

  // Values are handed out as copies.
  v->push_back(7);
  CHECK(c.get(3)->size() == 2);
}

TEST_CASE("info reports configuration and counters", "[cache][info]") {
  StrCache c({.capacity = 8, .default_ttl_ms = 250, .eviction_policy = "fifo",
              .enable_stats = true});
  c.set("a", "1");
  c.get("a");
  auto i = c.info();
  CHECK(i.find("policy_mode:fifo") != std::string::npos);
  CHECK(i.find("keys:1") != std::string::npos);
  CHECK(i.find("capacity:8") != std::string::npos);
  CHECK(i.find("default_ttl_ms:250") != std::string::npos);
  CHECK(i.find("hits:1") != std::string::npos);

  StrCache unbounded;
  CHECK(unbounded.info().find("capacity:unbounded") != std::string::npos);
  CHECK(unbounded.info().find("default_ttl_ms:-1") != std::string::npos);
}
