#include "simple_cache/cache.hpp"
#include "simple_cache/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
using StrCache = simple_cache::Cache<std::string, std::string>;

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c);
      }))
    return false;
  try {
    out = std::stoull(s);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream is(line);
  std::vector<std::string> out;
  std::string tok;
  while (is >> tok)
    out.push_back(tok);
  return out;
}

std::string handle(StrCache &cache, const std::vector<std::string> &cmd) {
  const auto op = upper(cmd[0]);
  const auto argc = cmd.size();
  std::uint64_t n = 0;

  if (op == "SET" && (argc == 3 || argc == 4)) {
    std::optional<std::uint64_t> ttl;
    if (argc == 4) {
      if (!parse_u64(cmd[3], n))
        return "ERR ttl must be a non-negative integer";
      ttl = n;
    }
    std::string err;
    if (!cache.set(cmd[1], cmd[2], ttl, &err))
      return "ERR " + err;
    return "OK";
  }
  if (op == "GET" && argc == 2) {
    auto v = cache.get(cmd[1]);
    return v.has_value() ? *v : "(nil)";
  }
  if (op == "HAS" && argc == 2)
    return cache.has(cmd[1]) ? "1" : "0";
  if (op == "DEL" && argc == 2)
    return cache.del(cmd[1]) ? "1" : "0";
  if (op == "TTL" && argc == 2)
    return std::to_string(cache.ttl(cmd[1]));
  if (op == "EXPIRE" && argc == 3) {
    if (!parse_u64(cmd[2], n))
      return "ERR ttl must be a non-negative integer";
    return cache.expire(cmd[1], n) ? "1" : "0";
  }
  if (op == "PERSIST" && argc == 2)
    return cache.persist(cmd[1]) ? "1" : "0";
  if (op == "KEYS" && argc == 1) {
    std::ostringstream os;
    std::size_t i = 0;
    for (const auto &k : cache.keys())
      os << (i++ ? "\n" : "") << k;
    return i ? os.str() : "(empty)";
  }
  if (op == "SIZE" && argc == 1)
    return std::to_string(cache.size());
  if (op == "CLEAR" && argc == 1) {
    cache.clear();
    return "OK";
  }
  if (op == "PURGE" && argc == 1)
    return std::to_string(cache.purge_expired());
  if (op == "STATS" && argc == 1) {
    const auto s = cache.get_stats();
    std::ostringstream os;
    os << "hits:" << s.hits << " misses:" << s.misses << " sets:" << s.sets
       << " deletes:" << s.deletes << " evictions:" << s.evictions
       << " expires:" << s.expires << " total_requests:" << s.total_requests
       << " hit_rate:" << s.hit_rate << " miss_rate:" << s.miss_rate;
    return os.str();
  }
  if (op == "RESETSTATS" && argc == 1) {
    cache.reset_stats();
    return "OK";
  }
  if (op == "STATSON" && argc == 1) {
    cache.enable_stats();
    return "OK";
  }
  if (op == "STATSOFF" && argc == 1) {
    cache.disable_stats();
    return "OK";
  }
  if (op == "INFO" && argc == 1)
    return cache.info();
  if (op == "DUMP" && argc == 2) {
    std::string err;
    if (!cache.dump_stats(cmd[1], &err))
      return "ERR " + err;
    return "OK";
  }
  return "ERR unknown command or wrong number of arguments";
}
} // namespace

int main(int argc, char **argv) {
  simple_cache::CacheConfig cfg;
  if (argc > 1) {
    std::string err;
    if (!simple_cache::load_config(argv[1], cfg, &err)) {
      std::cerr << "config load failed: " << err << "\n";
      return 1;
    }
  }

  StrCache cache(cfg);
  std::cout << "simple_cache_cli policy=" << cache.policy().name() << "\n";

  std::string line;
  while (std::getline(std::cin, line)) {
    auto cmd = split(line);
    if (cmd.empty())
      continue;
    if (upper(cmd[0]) == "QUIT")
      break;
    std::cout << handle(cache, cmd) << std::endl;
  }
  return 0;
}
