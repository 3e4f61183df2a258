#pragma once

#include "simple_cache/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace simple_cache {

// Victim selection over the store's recency order. Position 0 is the oldest
// key (least recently inserted, or least recently used under LRU).
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  // False when the policy refuses to evict and the write must be rejected.
  virtual bool allows_eviction() const = 0;
  // True when a read hit moves the key to the back of the order.
  virtual bool promotes_on_read() const = 0;
  virtual std::optional<std::size_t> pick_victim(std::size_t entry_count) = 0;
};

bool is_known_policy(const std::string &mode);

// Unknown names fall back to "lru". `rng` is only used by "random"; a
// randomly seeded source is created when none is given.
std::unique_ptr<IEvictionPolicy>
make_policy_by_name(const std::string &mode,
                    std::shared_ptr<IRandomSource> rng = nullptr);

} // namespace simple_cache
