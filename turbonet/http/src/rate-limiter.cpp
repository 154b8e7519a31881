#include "turbonet/rate-limiter.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbonet/log.hpp"
#include "turbonet/rate-limit-config.hpp"
#include "turbonet/timedef.hpp"

namespace turbonet {

namespace {

// Time needed to refill a bucket from empty to full.
SteadyDuration FullRefillDuration(double capacity, double refillRate) {
  return std::chrono::duration_cast<SteadyDuration>(std::chrono::duration<double>(capacity / refillRate));
}

const RateLimitConfig& Validated(const RateLimitConfig& config) {
  config.validate();
  return config;
}

}  // namespace

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : _capacity(Validated(config).capacity),
      _refillRate(config.refillRate),
      _idleRetention(
          std::max<SteadyDuration>(config.idleRetention, FullRefillDuration(config.capacity, config.refillRate))) {}

RateLimiter::RateLimiter(double capacity, double refillRate)
    : RateLimiter(RateLimitConfig{}.withEnabled().withCapacity(capacity).withRefillRate(refillRate)) {}

double RateLimiter::refilled(const Bucket& bucket, SteadyTimePoint now) const noexcept {
  if (now <= bucket.lastRefill) {
    return bucket.tokens;
  }
  const double elapsedSec = std::chrono::duration<double>(now - bucket.lastRefill).count();
  return std::min(_capacity, bucket.tokens + (elapsedSec * _refillRate));
}

RateLimiter::Decision RateLimiter::tryAcquire(std::string_view key, SteadyTimePoint now) {
  std::lock_guard<std::mutex> lock(_mutex);

  maybePurge(now);

  auto it = _buckets.find(key);
  if (it == _buckets.end()) {
    it = _buckets.emplace(std::string(key), Bucket{_capacity, now}).first;
  } else {
    it->second.tokens = refilled(it->second, now);
    // never move the refill point backwards
    it->second.lastRefill = std::max(it->second.lastRefill, now);
  }

  Bucket& bucket = it->second;
  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return {};
  }

  const double missingMs = (1.0 - bucket.tokens) * 1000.0 / _refillRate;
  // the epsilon absorbs the rounding noise of the refill computation
  return {false, std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::ceil(missingMs - 1e-6)))};
}

double RateLimiter::availableTokens(std::string_view key, SteadyTimePoint now) const {
  std::lock_guard<std::mutex> lock(_mutex);
  const auto it = _buckets.find(key);
  return it == _buckets.end() ? _capacity : refilled(it->second, now);
}

void RateLimiter::erase(std::string_view key) {
  std::lock_guard<std::mutex> lock(_mutex);
  const auto it = _buckets.find(key);
  if (it != _buckets.end()) {
    _buckets.erase(it);
  }
}

std::size_t RateLimiter::purgeIdle(SteadyTimePoint now) {
  std::lock_guard<std::mutex> lock(_mutex);
  const auto nbErased = std::erase_if(
      _buckets, [this, now](const auto& entry) { return now - entry.second.lastRefill >= _idleRetention; });
  if (nbErased != 0) {
    log::debug("Rate limiter discarded {} idle bucket(s), {} remaining", nbErased, _buckets.size());
  }
  return nbErased;
}

void RateLimiter::maybePurge(SteadyTimePoint now) {
  // amortized: at most one full scan per retention period
  if (now < _nextPurge) {
    return;
  }
  _nextPurge = now + _idleRetention;
  std::erase_if(_buckets, [this, now](const auto& entry) { return now - entry.second.lastRefill >= _idleRetention; });
}

std::size_t RateLimiter::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _buckets.size();
}

}  // namespace turbonet
