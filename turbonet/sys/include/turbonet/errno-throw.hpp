#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace turbonet {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: ThrowSystemError("bind failed on port {}", port);
template <typename... Args>
[[noreturn]] void ThrowSystemError(fmt::format_string<Args...> fmtStr, Args&&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()),
                          fmt::format(fmtStr, std::forward<Args>(args)...));
}

}  // namespace turbonet
