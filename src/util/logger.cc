#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <vector>
#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

namespace HawkLogger {

namespace {

const size_t kMinSecretLength = 4;

#ifdef HAWK_DEBUG_BUILD
const Level kDefaultLevel = DEBUG;
#else
const Level kDefaultLevel = INFO;
#endif

struct SinkState {
  std::mutex mutex;
  std::string file_path;
  std::vector<std::string> secrets;
};

SinkState& State() {
  static SinkState state;
  return state;
}

std::atomic<int> g_level(kDefaultLevel);

const char* LevelTag(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "?????";
  }
}

std::string ClockTime() {
  auto now = std::chrono::system_clock::now();
  long ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()).count() % 1000);
  std::time_t timer = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&timer, &local);

  char buf[16];
  snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03ld",
           local.tm_hour, local.tm_min, local.tm_sec, ms);
  return buf;
}

// Caller holds State().mutex
std::string MaskLocked(const std::string& text) {
  std::string out = text;
  for (const auto& secret : State().secrets) {
    size_t pos = 0;
    while ((pos = out.find(secret, pos)) != std::string::npos) {
      out.replace(pos, secret.size(), "***");
      pos += 3;
    }
  }
  return out;
}

bool AppendLine(const std::string& path, const std::string& line) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) return false;
  ssize_t written = write(fd, line.data(), line.size());
  close(fd);
  return written == static_cast<ssize_t>(line.size());
}

}  // namespace

void Logger::Init() {
  g_level = kDefaultLevel;
  std::lock_guard<std::mutex> lock(State().mutex);
  State().file_path.clear();
}

bool Logger::Init(const std::string& log_file_path) {
  Init();

  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] cannot open log file " << log_file_path << "; logging to stderr only"
              << std::endl;
    return false;
  }
  close(fd);

  std::lock_guard<std::mutex> lock(State().mutex);
  State().file_path = log_file_path;
  return true;
}

void Logger::SetLevel(Level level) {
  g_level = level;
}

Level Logger::GetLevel() {
  return static_cast<Level>(g_level.load());
}

Level Logger::ParseLevel(const std::string& name, Level fallback) {
  std::string lower;
  for (char c : name) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  if (lower == "debug") return DEBUG;
  if (lower == "info") return INFO;
  if (lower == "warn" || lower == "warning") return WARN;
  if (lower == "error") return ERROR;
  return fallback;
}

void Logger::AddSecret(const std::string& value) {
  if (value.size() < kMinSecretLength) return;
  std::lock_guard<std::mutex> lock(State().mutex);
  auto& secrets = State().secrets;
  if (std::find(secrets.begin(), secrets.end(), value) != secrets.end()) return;
  secrets.push_back(value);
  // Longest first so a secret containing another is masked whole
  std::sort(secrets.begin(), secrets.end(),
            [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

void Logger::ClearSecrets() {
  std::lock_guard<std::mutex> lock(State().mutex);
  State().secrets.clear();
}

std::string Logger::Mask(const std::string& text) {
  std::lock_guard<std::mutex> lock(State().mutex);
  return MaskLocked(text);
}

std::string Logger::FormatLine(Level level, const std::string& component,
                               const std::string& message) {
  return "[" + ClockTime() + "] [" + LevelTag(level) + "] [" + component + "] " + message;
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (!Enabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(State().mutex);
  std::string line = MaskLocked(FormatLine(level, component, message)) + "\n";
  std::cerr << line;

  if (!State().file_path.empty() && !AppendLine(State().file_path, line)) {
    std::cerr << "[Logger] write to " << State().file_path << " failed" << std::endl;
  }
}

} // namespace HawkLogger
