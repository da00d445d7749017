#include "hawk_time_source.h"
#include "hawk_string_utils.h"
#include <thread>
#include <random>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hawk {

TimeSource TimeSource::Default() {
  TimeSource source;
  source.now = [] { return std::chrono::steady_clock::now(); };
  source.sleep = [](Millis duration) {
    if (duration.count() > 0) {
      std::this_thread::sleep_for(duration);
    }
  };
  return source;
}

Millis RandomJitter(int64_t min_ms, int64_t max_ms) {
  if (max_ms <= min_ms) {
    return Millis(min_ms < 0 ? 0 : min_ms);
  }
  static thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_int_distribution<int64_t> dist(min_ms, max_ms);
  return Millis(dist(gen));
}

std::string UtcNowIso8601() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  gmtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

std::string LocalNowIso8601() {
  auto timer = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm bt{};
  localtime_r(&timer, &bt);
  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

std::string LocalTimestampCompact() {
  auto timer = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm bt{};
  localtime_r(&timer, &bt);
  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y%m%d_%H%M%S");
  return oss.str();
}

std::string RenderTimestampTemplate(const std::string& path_template) {
  return ReplaceAll(path_template, "{timestamp}", LocalTimestampCompact());
}

}  // namespace hawk
