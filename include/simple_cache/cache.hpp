#pragma once

#include "simple_cache/config.hpp"
#include "simple_cache/policy.hpp"
#include "simple_cache/stats.hpp"
#include "simple_cache/types.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <limits>
#include <list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace simple_cache {

// Bounded key-value cache with lazy TTL expiry and a pluggable eviction
// policy. Not internally synchronized: a host sharing one instance between
// threads must serialize every call.
template <typename K, typename V, typename Hash = std::hash<K>,
          typename KeyEqual = std::equal_to<K>>
class Cache {
public:
  using KeyList = std::list<K>;

  // Read-only range over the stored keys, oldest first. Each call to keys()
  // starts a fresh walk; any mutating call invalidates an open view.
  class KeyView {
  public:
    using const_iterator = typename KeyList::const_iterator;
    explicit KeyView(const KeyList &order) : order_(&order) {}
    const_iterator begin() const { return order_->begin(); }
    const_iterator end() const { return order_->end(); }
    std::size_t size() const { return order_->size(); }
    bool empty() const { return order_->empty(); }

  private:
    const KeyList *order_;
  };

  explicit Cache(CacheConfig cfg = {}, std::shared_ptr<IClock> clock = nullptr,
                 std::shared_ptr<IRandomSource> rng = nullptr);
  Cache(CacheConfig cfg, std::unique_ptr<IEvictionPolicy> policy,
        std::shared_ptr<IClock> clock = nullptr);

  // Fails when a new key would exceed capacity and the policy cannot make
  // room (always the case under "none"); `err` then reads "capacity exceeded"
  // and the new key is not stored.
  bool set(const K &key, V value,
           std::optional<std::uint64_t> ttl_ms = std::nullopt,
           std::string *err = nullptr);
  std::optional<V> get(const K &key);
  std::vector<std::optional<V>> mget(const std::vector<K> &keys);
  bool has(const K &key);
  bool del(const K &key);
  void clear();
  std::size_t size() const { return entries_.size(); }

  // -2 when absent, -1 when the key never expires, else remaining ms.
  std::int64_t ttl(const K &key);
  bool expire(const K &key, std::uint64_t ttl_ms);
  bool persist(const K &key);
  KeyView keys() const { return KeyView(order_); }

  std::size_t
  purge_expired(std::size_t limit = std::numeric_limits<std::size_t>::max());

  StatsSnapshot get_stats() const { return stats_.snapshot(); }
  void reset_stats() { stats_.reset(); }
  void enable_stats() { stats_.enable(); }
  void disable_stats() { stats_.disable(); }
  bool is_stats_enabled() const { return stats_.enabled(); }
  bool dump_stats(const std::string &path, std::string *err = nullptr) const {
    return stats_.dump(path, err);
  }

  std::string info() const;
  const CacheConfig &config() const { return cfg_; }
  const IEvictionPolicy &policy() const { return *policy_; }

private:
  struct Slot {
    Entry<V> entry;
    typename KeyList::iterator pos;
  };
  using Map = std::unordered_map<K, Slot, Hash, KeyEqual>;

  static bool is_expired(const Entry<V> &e, TimePoint now) {
    return e.expiry.has_value() && now > *e.expiry;
  }
  static TimePoint deadline_from(TimePoint now, std::uint64_t ttl_ms);

  typename Map::iterator find_live(const K &key, TimePoint now);
  void erase_internal(typename Map::iterator it);
  bool at_capacity() const {
    return cfg_.capacity.has_value() && entries_.size() >= *cfg_.capacity;
  }
  bool over_capacity() const {
    return cfg_.capacity.has_value() && entries_.size() > *cfg_.capacity;
  }
  // False when the policy could not bring the store back within capacity.
  bool evict_until_fit(TimePoint now);

  CacheConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  std::shared_ptr<IClock> clock_;
  Map entries_;
  KeyList order_;
  StatsCollector stats_;
};

template <typename K, typename V, typename Hash, typename KeyEqual>
Cache<K, V, Hash, KeyEqual>::Cache(CacheConfig cfg,
                                   std::shared_ptr<IClock> clock,
                                   std::shared_ptr<IRandomSource> rng)
    : cfg_(std::move(cfg)),
      policy_(make_policy_by_name(cfg_.eviction_policy, std::move(rng))),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      stats_(cfg_.enable_stats) {
  cfg_.eviction_policy = policy_->name();
}

template <typename K, typename V, typename Hash, typename KeyEqual>
Cache<K, V, Hash, KeyEqual>::Cache(CacheConfig cfg,
                                   std::unique_ptr<IEvictionPolicy> policy,
                                   std::shared_ptr<IClock> clock)
    : cfg_(std::move(cfg)), policy_(std::move(policy)),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      stats_(cfg_.enable_stats) {
  if (!policy_)
    policy_ = make_policy_by_name(cfg_.eviction_policy);
  cfg_.eviction_policy = policy_->name();
}

template <typename K, typename V, typename Hash, typename KeyEqual>
bool Cache<K, V, Hash, KeyEqual>::set(const K &key, V value,
                                      std::optional<std::uint64_t> ttl_ms,
                                      std::string *err) {
  const auto now = clock_->now();
  auto it = entries_.find(key);

  // Overwrites never grow the store, so only new keys can be refused.
  if (it == entries_.end() && !policy_->allows_eviction() && at_capacity()) {
    purge_expired();
    if (at_capacity()) {
      if (err)
        *err = "capacity exceeded";
      return false;
    }
  }

  std::optional<TimePoint> expiry;
  if (ttl_ms.has_value())
    expiry = deadline_from(now, *ttl_ms);
  else if (cfg_.default_ttl_ms.has_value())
    expiry = deadline_from(now, *cfg_.default_ttl_ms);

  // Overwrite in place: the store does not grow, so nothing is evicted.
  if (it != entries_.end()) {
    it->second.entry = Entry<V>{std::move(value), expiry};
    order_.splice(order_.end(), order_, it->second.pos);
    stats_.record_set();
    return true;
  }

  auto inserted = entries_
                      .emplace(key, Slot{Entry<V>{std::move(value), expiry},
                                         order_.end()})
                      .first;
  try {
    order_.push_back(key);
  } catch (...) {
    entries_.erase(inserted);
    throw;
  }
  inserted->second.pos = std::prev(order_.end());

  if (!evict_until_fit(now)) {
    auto self = entries_.find(key);
    if (self != entries_.end())
      erase_internal(self);
    if (err)
      *err = "capacity exceeded";
    return false;
  }
  stats_.record_set();
  return true;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
std::optional<V> Cache<K, V, Hash, KeyEqual>::get(const K &key) {
  auto it = find_live(key, clock_->now());
  if (it == entries_.end()) {
    stats_.record_miss();
    return std::nullopt;
  }
  if (policy_->promotes_on_read())
    order_.splice(order_.end(), order_, it->second.pos);
  stats_.record_hit();
  return it->second.entry.value;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
std::vector<std::optional<V>>
Cache<K, V, Hash, KeyEqual>::mget(const std::vector<K> &keys) {
  std::vector<std::optional<V>> out;
  out.reserve(keys.size());
  for (const auto &k : keys)
    out.push_back(get(k));
  return out;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
bool Cache<K, V, Hash, KeyEqual>::has(const K &key) {
  return find_live(key, clock_->now()) != entries_.end();
}

template <typename K, typename V, typename Hash, typename KeyEqual>
bool Cache<K, V, Hash, KeyEqual>::del(const K &key) {
  auto it = find_live(key, clock_->now());
  if (it == entries_.end())
    return false;
  erase_internal(it);
  stats_.record_delete();
  return true;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
void Cache<K, V, Hash, KeyEqual>::clear() {
  entries_.clear();
  order_.clear();
  if (stats_.enabled())
    stats_.reset();
}

template <typename K, typename V, typename Hash, typename KeyEqual>
std::int64_t Cache<K, V, Hash, KeyEqual>::ttl(const K &key) {
  const auto now = clock_->now();
  auto it = find_live(key, now);
  if (it == entries_.end())
    return -2;
  const auto &expiry = it->second.entry.expiry;
  if (!expiry.has_value())
    return -1;
  const auto remain =
      std::chrono::duration_cast<std::chrono::milliseconds>(*expiry - now)
          .count();
  return std::max<std::int64_t>(0, remain);
}

template <typename K, typename V, typename Hash, typename KeyEqual>
bool Cache<K, V, Hash, KeyEqual>::expire(const K &key, std::uint64_t ttl_ms) {
  const auto now = clock_->now();
  auto it = find_live(key, now);
  if (it == entries_.end())
    return false;
  it->second.entry.expiry = deadline_from(now, ttl_ms);
  return true;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
bool Cache<K, V, Hash, KeyEqual>::persist(const K &key) {
  auto it = find_live(key, clock_->now());
  if (it == entries_.end())
    return false;
  it->second.entry.expiry.reset();
  return true;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
std::size_t Cache<K, V, Hash, KeyEqual>::purge_expired(std::size_t limit) {
  const auto now = clock_->now();
  std::size_t removed = 0;
  for (auto pos = order_.begin(); pos != order_.end() && removed < limit;) {
    auto it = entries_.find(*pos);
    ++pos;
    if (it != entries_.end() && is_expired(it->second.entry, now)) {
      erase_internal(it);
      stats_.record_expire();
      ++removed;
    }
  }
  return removed;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
std::string Cache<K, V, Hash, KeyEqual>::info() const {
  std::ostringstream os;
  os << "policy_mode:" << policy_->name() << "\n";
  os << "keys:" << entries_.size() << "\n";
  os << "capacity:";
  if (cfg_.capacity.has_value())
    os << *cfg_.capacity;
  else
    os << "unbounded";
  os << "\n";
  os << "default_ttl_ms:";
  if (cfg_.default_ttl_ms.has_value())
    os << *cfg_.default_ttl_ms;
  else
    os << -1;
  os << "\n";
  os << stats_.info();
  return os.str();
}

template <typename K, typename V, typename Hash, typename KeyEqual>
TimePoint Cache<K, V, Hash, KeyEqual>::deadline_from(TimePoint now,
                                                     std::uint64_t ttl_ms) {
  // Saturate instead of overflowing the clock's representation.
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
                            TimePoint::max() - now)
                            .count();
  const auto ms = std::min<std::uint64_t>(
      ttl_ms, static_cast<std::uint64_t>(std::max<std::int64_t>(0, headroom)));
  return now + std::chrono::milliseconds(static_cast<std::int64_t>(ms));
}

template <typename K, typename V, typename Hash, typename KeyEqual>
typename Cache<K, V, Hash, KeyEqual>::Map::iterator
Cache<K, V, Hash, KeyEqual>::find_live(const K &key, TimePoint now) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return it;
  if (is_expired(it->second.entry, now)) {
    erase_internal(it);
    stats_.record_expire();
    return entries_.end();
  }
  return it;
}

template <typename K, typename V, typename Hash, typename KeyEqual>
void Cache<K, V, Hash, KeyEqual>::erase_internal(typename Map::iterator it) {
  order_.erase(it->second.pos);
  entries_.erase(it);
}

template <typename K, typename V, typename Hash, typename KeyEqual>
bool Cache<K, V, Hash, KeyEqual>::evict_until_fit(TimePoint now) {
  std::size_t safety = entries_.size() + 1;
  while (over_capacity() && safety-- > 0) {
    auto victim = policy_->pick_victim(entries_.size());
    if (!victim.has_value() || *victim >= order_.size())
      break;
    auto pos = std::next(order_.begin(),
                         static_cast<std::ptrdiff_t>(*victim));
    auto it = entries_.find(*pos);
    if (it == entries_.end())
      break;
    // An already-dead victim leaves as an expiry, not an eviction.
    const bool stale = is_expired(it->second.entry, now);
    erase_internal(it);
    if (stale)
      stats_.record_expire();
    else
      stats_.record_eviction();
  }
  return !over_capacity();
}

} // namespace simple_cache
