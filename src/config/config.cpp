#include "simple_cache/config.hpp"
#include "simple_cache/policy.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace simple_cache {
namespace {
constexpr std::uint64_t kMaxCapacity = 1ULL << 40;
constexpr std::uint64_t kMaxTtlMs = 1ULL << 48;

bool has_key(const std::string &text, const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:");
  return std::regex_search(text, re);
}
bool extract_null(const std::string &text, const std::string &key) {
  std::regex re("\"" + key + "\"\\s*:\\s*null");
  return std::regex_search(text, re);
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  try {
    out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  } catch (const std::out_of_range &) {
    out = std::numeric_limits<std::uint64_t>::max();
  }
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
} // namespace

bool validate_config(const CacheConfig &cfg, std::string *err) {
  if (cfg.capacity.has_value() && *cfg.capacity == 0) {
    if (err)
      *err = "invalid capacity";
    return false;
  }
  if (!is_known_policy(cfg.eviction_policy)) {
    if (err)
      *err = "unknown eviction policy";
    return false;
  }
  return true;
}

bool load_config(const std::string &path, CacheConfig &cfg,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig next = cfg;
  std::uint64_t u;
  bool b;
  std::string s;

  if (extract_null(text, "capacity")) {
    next.capacity.reset();
  } else if (extract_u64(text, "capacity", u)) {
    next.capacity = static_cast<std::size_t>(std::min(u, kMaxCapacity));
  } else if (has_key(text, "capacity")) {
    if (err)
      *err = "invalid capacity";
    return false;
  }

  if (extract_null(text, "default_ttl_ms")) {
    next.default_ttl_ms.reset();
  } else if (extract_u64(text, "default_ttl_ms", u)) {
    next.default_ttl_ms = std::min(u, kMaxTtlMs);
  } else if (has_key(text, "default_ttl_ms")) {
    if (err)
      *err = "invalid default_ttl_ms";
    return false;
  }

  if (extract_string(text, "eviction_policy", s)) {
    next.eviction_policy = s;
  } else if (has_key(text, "eviction_policy")) {
    if (err)
      *err = "invalid eviction_policy";
    return false;
  }

  if (extract_bool(text, "enable_stats", b)) {
    next.enable_stats = b;
  } else if (has_key(text, "enable_stats")) {
    if (err)
      *err = "invalid enable_stats";
    return false;
  }

  if (!validate_config(next, err))
    return false;
  cfg = std::move(next);
  return true;
}

} // namespace simple_cache
