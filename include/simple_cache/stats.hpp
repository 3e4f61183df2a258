#pragma once

#include <cstdint>
#include <string>

namespace simple_cache {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
  std::uint64_t expires{0};
};

struct StatsSnapshot {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t sets{0};
  std::uint64_t deletes{0};
  std::uint64_t evictions{0};
  std::uint64_t expires{0};
  std::uint64_t total_requests{0};
  double hit_rate{0.0};
  double miss_rate{0.0};
};

// Counters only move while recording is enabled. Toggling never rewrites
// what was already counted.
class StatsCollector {
public:
  explicit StatsCollector(bool enabled = false) : enabled_(enabled) {}

  void record_hit() { if (enabled_) ++counters_.hits; }
  void record_miss() { if (enabled_) ++counters_.misses; }
  void record_set() { if (enabled_) ++counters_.sets; }
  void record_delete() { if (enabled_) ++counters_.deletes; }
  void record_eviction() { if (enabled_) ++counters_.evictions; }
  void record_expire() { if (enabled_) ++counters_.expires; }

  void enable() { enabled_ = true; }
  void disable() { enabled_ = false; }
  bool enabled() const { return enabled_; }

  void reset() { counters_ = CacheStats{}; }

  // Rates are percentages rounded to two decimals, 0 with no requests.
  StatsSnapshot snapshot() const;
  std::string info() const;
  bool dump(const std::string &path, std::string *err = nullptr) const;

private:
  bool enabled_;
  CacheStats counters_;
};

} // namespace simple_cache
