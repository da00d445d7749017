#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace hawk {

using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// Clock and sleep used by everything that waits or expires
struct TimeSource {
  std::function<SteadyTime()> now;
  std::function<void(Millis)> sleep;

  static TimeSource Default();
};

// Uniform random duration in [min_ms, max_ms]
Millis RandomJitter(int64_t min_ms, int64_t max_ms);

// 2026-10-19T08:15:02.123Z
std::string UtcNowIso8601();
// Local time, 2026-10-19T10:15:02
std::string LocalNowIso8601();
// Local time, 20261019_101502
std::string LocalTimestampCompact();

// Replaces every "{timestamp}" with LocalTimestampCompact()
std::string RenderTimestampTemplate(const std::string& path_template);

}  // namespace hawk
