#pragma once

#include <chrono>

namespace courier {

/// Alias some types to make it easier to use
/// SysClock is used for wall-clock values exchanged with servers (Last-Modified, Date).
/// Request lifetimes are measured with SteadyClock as it is monotonic.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace courier
