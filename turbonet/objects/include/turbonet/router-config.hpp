#pragma once

#include <cstdint>

namespace turbonet {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Normalize, Redirect };

  // Behavior for paths differing from a registered route only by a trailing slash.
  // An exact match is always tried first, then:
  //   Strict   : no implicit mapping, the other variant is a 404.
  //   Normalize: the existing variant is dispatched without redirect.
  //   Redirect : a request with an added trailing slash for a registered canonical path gets a 301 to it
  //              (never the inverse, which stays a 404).
  // The root path "/" is never redirected nor normalized.
  // Default: Normalize
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Normalize};

  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy) {
    trailingSlashPolicy = policy;
    return *this;
  }
};

}  // namespace turbonet
