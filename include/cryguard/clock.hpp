#pragma once

#include <string>

namespace cryguard {

// Monotonic seconds from the OpenCV tick counter.
double monotonic_seconds();
// Seconds since the Unix epoch.
double wall_seconds();
std::string iso_utc(double wall_sec);

}  // namespace cryguard
