#include "hawk_backoff_controller.h"
#include "logger.h"
#include <algorithm>
#include <utility>

namespace hawk {

BackoffController::BackoffController(const BackoffConfig& config, TimeSource time)
    : base_(std::max(config.base_seconds, 0)),
      cap_(std::max(config.cap_seconds, std::max(config.base_seconds, 0))),
      time_(std::move(time)) {}

void BackoffController::OnChallenge() {
  consecutive_++;
}

void BackoffController::OnClear() {
  if (consecutive_ > 0) {
    LOG_DEBUG("Backoff", "Cleared after " + std::to_string(consecutive_) +
              " consecutive challenge(s)");
  }
  consecutive_ = 0;
}

std::chrono::seconds BackoffController::ComputeDelay() const {
  int exponent = std::max(consecutive_ - 1, 0);
  int64_t delay = base_.count();
  // Doubling stops as soon as the cap is reached, so no overflow
  for (int i = 0; i < exponent && delay < cap_.count(); ++i) {
    delay *= 2;
  }
  return std::chrono::seconds(std::min<int64_t>(delay, cap_.count()));
}

std::chrono::seconds BackoffController::Wait() {
  std::chrono::seconds delay = ComputeDelay();
  LOG_INFO("Backoff", "Challenge #" + std::to_string(consecutive_) + ", backing off " +
           std::to_string(delay.count()) + "s");
  time_.sleep(std::chrono::duration_cast<Millis>(delay));
  return delay;
}

}  // namespace hawk
