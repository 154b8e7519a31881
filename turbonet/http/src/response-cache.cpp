#include "turbonet/response-cache.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/http-response.hpp"
#include "turbonet/log.hpp"
#include "turbonet/timedef.hpp"

namespace turbonet {

ResponseCache::Lookup ResponseCache::getOrPopulate(std::string_view key, const PopulateFn& populateFn,
                                                   SteadyDuration ttl, SteadyTimePoint now) {
  std::unique_lock<std::mutex> lock(_mutex);

  auto it = _entries.find(key);
  if (it == _entries.end()) {
    it = _entries.emplace(std::string(key), Entry{}).first;
  } else {
    Entry& entry = it->second;
    if (entry.response && entry.expiresAt > now) {
      return {entry.response, now - entry.storedAt, Outcome::Hit};
    }
    if (entry.populationId != 0) {
      if (entry.response) {
        return {entry.response, now - entry.storedAt, Outcome::Stale};
      }
      std::shared_future<ResponsePtr> inflight = entry.inflight;
      lock.unlock();
      // rethrows the exception of the populating caller, if any
      return {inflight.get(), SteadyDuration{}, Outcome::Coalesced};
    }
  }

  // this caller populates the entry
  std::promise<ResponsePtr> promise;
  const uint64_t populationId = _nextPopulationId++;
  it->second.populationId = populationId;
  it->second.inflight = promise.get_future().share();
  lock.unlock();

  ResponsePtr response;
  try {
    response = std::make_shared<const HttpResponse>(populateFn());
  } catch (...) {
    onPopulationFailure(key, populationId);
    promise.set_exception(std::current_exception());
    throw;
  }

  lock.lock();
  it = _entries.find(key);
  if (it == _entries.end()) {
    // invalidated in the meantime
    it = _entries.emplace(std::string(key), Entry{}).first;
  }
  Entry& entry = it->second;
  entry.response = response;
  entry.storedAt = now;
  entry.expiresAt = now + ttl;
  if (entry.populationId == populationId) {
    entry.populationId = 0;
    entry.inflight = {};
  }
  lock.unlock();

  promise.set_value(response);
  return {std::move(response), SteadyDuration{}, Outcome::Miss};
}

void ResponseCache::onPopulationFailure(std::string_view key, uint64_t populationId) {
  std::lock_guard<std::mutex> lock(_mutex);
  const auto it = _entries.find(key);
  if (it == _entries.end() || it->second.populationId != populationId) {
    return;
  }
  if (it->second.response) {
    // keep the stale value, next caller retries
    it->second.populationId = 0;
    it->second.inflight = {};
  } else {
    _entries.erase(it);
  }
  log::debug("Cache population failed for key {}", key);
}

void ResponseCache::invalidate(std::string_view key) {
  std::lock_guard<std::mutex> lock(_mutex);
  const auto it = _entries.find(key);
  if (it == _entries.end()) {
    return;
  }
  if (it->second.populationId != 0) {
    // waiters still need the in-flight marker
    it->second.response.reset();
  } else {
    _entries.erase(it);
  }
}

void ResponseCache::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  std::erase_if(_entries, [](const auto& keyEntry) { return keyEntry.second.populationId == 0; });
  for (auto& [key, entry] : _entries) {
    entry.response.reset();
  }
}

std::size_t ResponseCache::purgeExpired(SteadyTimePoint now) {
  std::lock_guard<std::mutex> lock(_mutex);
  return std::erase_if(_entries, [now](const auto& keyEntry) {
    return keyEntry.second.populationId == 0 && keyEntry.second.expiresAt <= now;
  });
}

std::size_t ResponseCache::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  std::size_t nbValues = 0;
  for (const auto& [key, entry] : _entries) {
    nbValues += entry.response ? 1U : 0U;
  }
  return nbValues;
}

}  // namespace turbonet
