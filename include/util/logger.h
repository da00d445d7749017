#ifndef HAWK_LOGGER_H_
#define HAWK_LOGGER_H_

#include <string>

namespace HawkLogger {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

/**
 * Process-wide component logger.
 *
 * Lines look like "[12:00:01.250] [WARN ] [RunSession] message" and go to
 * stderr. With a log file set, each line is also appended to it with
 * O_APPEND, opening the file per line so concurrent collector processes can
 * share one log. Registered secrets are masked before anything is written.
 */
class Logger {
public:
  // Resets level to the build default and stops writing to a file
  static void Init();
  // Also append every line to log_file_path; false if it cannot be opened
  static bool Init(const std::string& log_file_path);

  static void SetLevel(Level level);
  static Level GetLevel();
  static bool Enabled(Level level) { return level >= GetLevel(); }

  // "debug", "info", "warn"/"warning", "error"; anything else yields fallback
  static Level ParseLevel(const std::string& name, Level fallback = INFO);

  // Every later occurrence of value is written as "***"; short values are ignored
  static void AddSecret(const std::string& value);
  static void ClearSecrets();
  static std::string Mask(const std::string& text);

  static void Log(Level level, const std::string& component, const std::string& message);

  // The formatted line, without the trailing newline
  static std::string FormatLine(Level level, const std::string& component,
                                const std::string& message);
};

} // namespace HawkLogger

#ifdef HAWK_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) HawkLogger::Logger::Log(HawkLogger::DEBUG, component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define HAWK_LOG_AT(level, component, msg) \
  do { \
    if (HawkLogger::Logger::Enabled(level)) HawkLogger::Logger::Log(level, component, msg); \
  } while (0)

#define LOG_INFO(component, msg) HAWK_LOG_AT(HawkLogger::INFO, component, msg)
#define LOG_WARN(component, msg) HAWK_LOG_AT(HawkLogger::WARN, component, msg)
#define LOG_ERROR(component, msg) HAWK_LOG_AT(HawkLogger::ERROR, component, msg)

#endif  // HAWK_LOGGER_H_
