#include "time.hpp"

#include <cmath>

namespace execmon::util {

TimePoint Now() {
  return Clock::now();
}

double ToSeconds(Clock::duration d) {
  return std::chrono::duration_cast<Seconds>(d).count();
}

// Clamped at zero; a non-finite result also yields zero.
double SecondsBetween(TimePoint start, TimePoint end) {
  if (end <= start) return 0.0;
  const double seconds = ToSeconds(end - start);
  return std::isfinite(seconds) ? seconds : 0.0;
}

Clock::duration FromSeconds(double seconds) {
  if (!(seconds > 0.0)) return Clock::duration::zero();

  const auto cap = std::chrono::duration_cast<Clock::duration>(kMaxDuration);
  if (seconds >= std::chrono::duration_cast<Seconds>(cap).count()) return cap;

  return std::chrono::duration_cast<Clock::duration>(Seconds(seconds));
}

} // namespace execmon::util
