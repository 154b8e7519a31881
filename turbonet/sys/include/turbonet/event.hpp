#pragma once

#include <cstdint>

namespace turbonet {

using EventBmp = uint32_t;

// Mirrors the epoll flags so that headers do not need <sys/epoll.h>.
inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventOut = 0x004;
inline constexpr EventBmp EventErr = 0x008;
inline constexpr EventBmp EventHup = 0x010;
inline constexpr EventBmp EventRdHup = 0x2000;

}  // namespace turbonet
