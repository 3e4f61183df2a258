#include "simple_cache/stats.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace simple_cache {
namespace {
double percent_2dp(std::uint64_t part, std::uint64_t total) {
  if (total == 0)
    return 0.0;
  const double pct =
      static_cast<double>(part) / static_cast<double>(total) * 100.0;
  return std::round(pct * 100.0) / 100.0;
}
} // namespace

StatsSnapshot StatsCollector::snapshot() const {
  StatsSnapshot s;
  s.hits = counters_.hits;
  s.misses = counters_.misses;
  s.sets = counters_.sets;
  s.deletes = counters_.deletes;
  s.evictions = counters_.evictions;
  s.expires = counters_.expires;
  s.total_requests = s.hits + s.misses;
  s.hit_rate = percent_2dp(s.hits, s.total_requests);
  s.miss_rate = percent_2dp(s.misses, s.total_requests);
  return s;
}

std::string StatsCollector::info() const {
  const auto s = snapshot();
  std::ostringstream os;
  os << "stats_enabled:" << (enabled_ ? 1 : 0) << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "sets:" << s.sets << "\n";
  os << "deletes:" << s.deletes << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expires:" << s.expires << "\n";
  os << "total_requests:" << s.total_requests << "\n";
  os << std::fixed << std::setprecision(2);
  os << "hit_rate:" << s.hit_rate << "\n";
  os << "miss_rate:" << s.miss_rate << "\n";
  return os.str();
}

bool StatsCollector::dump(const std::string &path, std::string *err) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    if (err)
      *err = "cannot open stats file";
    return false;
  }
  const auto s = snapshot();
  out << "{\"hits\":" << s.hits << ",\"misses\":" << s.misses
      << ",\"sets\":" << s.sets << ",\"deletes\":" << s.deletes
      << ",\"evictions\":" << s.evictions << ",\"expires\":" << s.expires
      << ",\"total_requests\":" << s.total_requests << std::fixed
      << std::setprecision(2) << ",\"hit_rate\":" << s.hit_rate
      << ",\"miss_rate\":" << s.miss_rate << "}\n";
  out.flush();
  if (!out) {
    if (err)
      *err = "stats write failed";
    return false;
  }
  return true;
}

} // namespace simple_cache
