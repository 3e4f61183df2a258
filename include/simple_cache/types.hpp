#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace simple_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

template <typename V> struct Entry {
  V value;
  std::optional<TimePoint> expiry;
};

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

// Settable clock for hosts that drive time themselves (tests, replays).
class ManualClock final : public IClock {
public:
  explicit ManualClock(TimePoint start = Clock::now()) : now_(start) {}
  TimePoint now() const override { return now_; }
  void set(TimePoint t) { now_ = t; }
  void advance(std::uint64_t ms) { now_ += std::chrono::milliseconds(ms); }

private:
  TimePoint now_;
};

class IRandomSource {
public:
  virtual ~IRandomSource() = default;
  // Uniform in [0, n). n is never zero.
  virtual std::size_t uniform_index(std::size_t n) = 0;
};

class Mt19937RandomSource final : public IRandomSource {
public:
  Mt19937RandomSource() : rng_(std::random_device{}()) {}
  explicit Mt19937RandomSource(std::uint64_t seed) : rng_(seed) {}
  std::size_t uniform_index(std::size_t n) override {
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(rng_);
  }

private:
  std::mt19937_64 rng_;
};

} // namespace simple_cache
