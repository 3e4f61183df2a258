#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace simple_cache {

struct CacheConfig {
  std::optional<std::size_t> capacity;        // unset = unbounded
  std::optional<std::uint64_t> default_ttl_ms; // unset = never expires
  std::string eviction_policy{"lru"};          // lru | fifo | random | none
  bool enable_stats{false};
};

bool validate_config(const CacheConfig &cfg, std::string *err = nullptr);

// Reads a flat JSON object with the CacheConfig field names. Keys missing
// from the file keep their current value in `cfg`. On failure `cfg` is left
// untouched.
bool load_config(const std::string &path, CacheConfig &cfg,
                 std::string *err = nullptr);

} // namespace simple_cache
