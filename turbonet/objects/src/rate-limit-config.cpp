#include "turbonet/rate-limit-config.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>

namespace turbonet {

RateLimitConfig& RateLimitConfig::withEnabled(bool on) {
  enabled = on;
  return *this;
}

RateLimitConfig& RateLimitConfig::withCapacity(double capacity) {
  this->capacity = capacity;
  return *this;
}

RateLimitConfig& RateLimitConfig::withRefillRate(double tokensPerSecond) {
  refillRate = tokensPerSecond;
  return *this;
}

RateLimitConfig& RateLimitConfig::withIdleRetention(std::chrono::milliseconds retention) {
  idleRetention = retention;
  return *this;
}

void RateLimitConfig::validate() const {
  if (!std::isfinite(capacity) || capacity < 1.0) {
    throw std::invalid_argument("rate limit capacity must be >= 1");
  }
  if (!std::isfinite(refillRate) || refillRate <= 0.0) {
    throw std::invalid_argument("rate limit refill rate must be > 0");
  }
  if (idleRetention.count() < 0) {
    throw std::invalid_argument("rate limit idle retention must be non-negative");
  }
}

}  // namespace turbonet
