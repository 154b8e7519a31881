#pragma once

#include <chrono>

namespace turbonet {

/// Alias some types to make it easier to use
/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time
/// (used for the Date header). Every expiry / refill / heartbeat computation is done on steady_clock, and the
/// components taking time points accept them as parameters so that unit tests can drive time explicitly.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace turbonet
