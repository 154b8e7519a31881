#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "turbonet/rate-limit-config.hpp"
#include "turbonet/timedef.hpp"

namespace turbonet {

// Per-key token buckets. Thread safe: concurrent calls are serialized by an internal mutex, so a token is never lost
// nor granted twice.
class RateLimiter {
 public:
  struct Decision {
    bool allowed{true};
    // When rejected, time until the next token is available.
    std::chrono::milliseconds retryAfter{};
  };

  // Throws std::invalid_argument if the configuration is invalid.
  explicit RateLimiter(const RateLimitConfig& config);

  RateLimiter(double capacity, double refillRate);

  // Refills the bucket of 'key' by 'elapsed * refillRate' (capped at capacity), then takes one token if possible.
  // A missing bucket is created full.
  [[nodiscard]] Decision tryAcquire(std::string_view key, SteadyTimePoint now);

  [[nodiscard]] Decision tryAcquire(std::string_view key) { return tryAcquire(key, SteadyClock::now()); }

  // Tokens currently available for 'key' at 'now', without consuming any.
  [[nodiscard]] double availableTokens(std::string_view key, SteadyTimePoint now) const;

  // Discards the bucket of 'key', if any.
  void erase(std::string_view key);

  // Discards the buckets idle for longer than the retention window. Returns the number of discarded buckets.
  std::size_t purgeIdle(SteadyTimePoint now);

  // Number of tracked buckets.
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] double capacity() const noexcept { return _capacity; }

  [[nodiscard]] double refillRate() const noexcept { return _refillRate; }

  [[nodiscard]] SteadyDuration idleRetention() const noexcept { return _idleRetention; }

 private:
  struct Bucket {
    double tokens;
    SteadyTimePoint lastRefill;
  };

  struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view str) const noexcept { return std::hash<std::string_view>{}(str); }
  };

  using BucketMap = std::unordered_map<std::string, Bucket, StringHash, std::equal_to<>>;

  [[nodiscard]] double refilled(const Bucket& bucket, SteadyTimePoint now) const noexcept;

  void maybePurge(SteadyTimePoint now);

  double _capacity;
  double _refillRate;
  SteadyDuration _idleRetention;
  mutable std::mutex _mutex;
  BucketMap _buckets;
  SteadyTimePoint _nextPurge{};
};

}  // namespace turbonet
