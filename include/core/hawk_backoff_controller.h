#pragma once

#include <chrono>
#include "hawk_config.h"
#include "hawk_time_source.h"

namespace hawk {

/**
 * BackoffController - consecutive-challenge counter for one browser session
 *
 * delay = min(base * 2^(count-1), cap). The counter is not per URL: blocks on
 * different URLs still compound, since they all point at the same burned
 * network identity. A count of 0 gives the base delay.
 */
class BackoffController {
public:
  explicit BackoffController(const BackoffConfig& config,
                             TimeSource time = TimeSource::Default());

  void OnChallenge();
  void OnClear();

  int ConsecutiveCount() const { return consecutive_; }
  std::chrono::seconds ComputeDelay() const;

  // Sleeps ComputeDelay() and returns what was slept
  std::chrono::seconds Wait();

private:
  std::chrono::seconds base_;
  std::chrono::seconds cap_;
  int consecutive_ = 0;
  TimeSource time_;
};

}  // namespace hawk
