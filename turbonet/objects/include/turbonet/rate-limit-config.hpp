#pragma once

#include <chrono>
#include <cstdint>

namespace turbonet {

// Token bucket parameters.
// A bucket holds at most 'capacity' tokens and regains 'refillRate' tokens per second. Each admitted request or
// message consumes one token.
struct RateLimitConfig {
  // Whether rate limiting is performed at all. Default: false (HTTP traffic is not limited unless asked for).
  bool enabled{false};

  // Maximum number of tokens of a bucket, which is also the largest accepted burst. Must be >= 1.
  double capacity{100.0};

  // Tokens regained per second. Must be > 0.
  double refillRate{50.0};

  // Buckets not touched during this period are discarded opportunistically. The retention is always extended to at
  // least the time needed to refill a bucket completely, so that discarding one can never grant more than a fresh
  // bucket would. Default: 60s.
  std::chrono::milliseconds idleRetention{std::chrono::seconds{60}};

  RateLimitConfig& withEnabled(bool on = true);

  RateLimitConfig& withCapacity(double capacity);

  RateLimitConfig& withRefillRate(double tokensPerSecond);

  RateLimitConfig& withIdleRetention(std::chrono::milliseconds retention);

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  bool operator==(const RateLimitConfig&) const noexcept = default;
};

}  // namespace turbonet
