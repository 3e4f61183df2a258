#include "simple_cache/policy.hpp"

#include <utility>

namespace simple_cache {
namespace {

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }
  bool allows_eviction() const override { return true; }
  bool promotes_on_read() const override { return true; }
  std::optional<std::size_t> pick_victim(std::size_t entry_count) override {
    if (entry_count == 0)
      return std::nullopt;
    return 0;
  }
};

class FifoPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "fifo"; }
  bool allows_eviction() const override { return true; }
  bool promotes_on_read() const override { return false; }
  std::optional<std::size_t> pick_victim(std::size_t entry_count) override {
    if (entry_count == 0)
      return std::nullopt;
    return 0;
  }
};

class RandomPolicy final : public IEvictionPolicy {
public:
  explicit RandomPolicy(std::shared_ptr<IRandomSource> rng)
      : rng_(std::move(rng)) {}
  std::string name() const override { return "random"; }
  bool allows_eviction() const override { return true; }
  bool promotes_on_read() const override { return false; }
  std::optional<std::size_t> pick_victim(std::size_t entry_count) override {
    if (entry_count == 0)
      return std::nullopt;
    const auto idx = rng_->uniform_index(entry_count);
    // Guard against sources that ignore the bound.
    return idx < entry_count ? idx : entry_count - 1;
  }

private:
  std::shared_ptr<IRandomSource> rng_;
};

class NoEvictionPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "none"; }
  bool allows_eviction() const override { return false; }
  bool promotes_on_read() const override { return false; }
  std::optional<std::size_t> pick_victim(std::size_t) override {
    return std::nullopt;
  }
};

} // namespace

bool is_known_policy(const std::string &mode) {
  return mode == "lru" || mode == "fifo" || mode == "random" ||
         mode == "none";
}

std::unique_ptr<IEvictionPolicy>
make_policy_by_name(const std::string &mode,
                    std::shared_ptr<IRandomSource> rng) {
  if (mode == "fifo")
    return std::make_unique<FifoPolicy>();
  if (mode == "random") {
    if (!rng)
      rng = std::make_shared<Mt19937RandomSource>();
    return std::make_unique<RandomPolicy>(std::move(rng));
  }
  if (mode == "none")
    return std::make_unique<NoEvictionPolicy>();
  return std::make_unique<LruPolicy>();
}

} // namespace simple_cache
