#pragma once

#include <chrono>

namespace execmon::util {

/*
  Time utilities. Single place to control the clock source.

  All execution timing is monotonic; wall clock time never enters a duration.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds   = std::chrono::duration<double>;

TimePoint Now();

double ToSeconds(Clock::duration d);
double SecondsBetween(TimePoint start, TimePoint end);

// Longest duration handed to the clock. Far enough to mean "never", near
// enough that now() + kMaxDuration cannot overflow a 64-bit tick count.
inline constexpr std::chrono::hours kMaxDuration{24 * 365 * 100};

// Saturates: NaN or <= 0 yields zero, anything beyond kMaxDuration yields
// kMaxDuration.
Clock::duration FromSeconds(double seconds);

} // namespace execmon::util
