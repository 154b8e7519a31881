#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "turbonet/http-response.hpp"
#include "turbonet/timedef.hpp"

namespace turbonet {

// TTL keyed store of responses with single-flight population.
//
// For a given key, at most one caller runs the population function at a time. While it runs:
//  - callers for a key holding an expired entry immediately get the stale value (stale-while-revalidate),
//  - callers for a key without any value wait for the in-flight result.
// A failed population propagates its exception to its caller and to the waiters. The entry is not poisoned: the
// previous value (if any) is kept and the next caller retries.
// The internal mutex is never held while the population function runs.
class ResponseCache {
 public:
  using ResponsePtr = std::shared_ptr<const HttpResponse>;

  using PopulateFn = std::function<HttpResponse()>;

  enum class Outcome : std::uint8_t {
    Hit,        // fresh entry served, population function not called
    Miss,       // population function called by this caller
    Stale,      // expired entry served while another caller repopulates it
    Coalesced   // waited for the population run by another caller
  };

  struct Lookup {
    ResponsePtr response;
    SteadyDuration age{};  // time elapsed since the served value was stored
    Outcome outcome{Outcome::Miss};
  };

  ResponseCache() = default;

  ResponseCache(const ResponseCache&) = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  // Returns the cached response for 'key', populating it with 'populateFn' on a miss or an expired entry.
  // Any exception thrown by 'populateFn' is rethrown.
  Lookup getOrPopulate(std::string_view key, const PopulateFn& populateFn, SteadyDuration ttl, SteadyTimePoint now);

  Lookup getOrPopulate(std::string_view key, const PopulateFn& populateFn, SteadyDuration ttl) {
    return getOrPopulate(key, populateFn, ttl, SteadyClock::now());
  }

  // Drops the value of 'key'. An in-flight population for it still completes and stores its result.
  void invalidate(std::string_view key);

  void clear();

  // Drops the expired entries not being repopulated. Returns the number of dropped entries.
  std::size_t purgeExpired(SteadyTimePoint now);

  [[nodiscard]] std::size_t size() const;

 private:
  struct Entry {
    ResponsePtr response;
    SteadyTimePoint storedAt{};
    SteadyTimePoint expiresAt{};
    std::shared_future<ResponsePtr> inflight;
    // non zero while a population is in flight
    uint64_t populationId{};
  };

  struct StringHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view str) const noexcept { return std::hash<std::string_view>{}(str); }
  };

  using EntryMap = std::unordered_map<std::string, Entry, StringHash, std::equal_to<>>;

  void onPopulationFailure(std::string_view key, uint64_t populationId);

  mutable std::mutex _mutex;
  EntryMap _entries;
  uint64_t _nextPopulationId{1};
};

}  // namespace turbonet
