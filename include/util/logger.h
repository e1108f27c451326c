#ifndef SHIELD_LOGGER_H_
#define SHIELD_LOGGER_H_

#include <atomic>
#include <string>

namespace shield {
namespace log {

enum Level {
  DEBUG,
  INFO,
  WARN,
  ERROR
};

class Logger {
public:
  static void Init();
  static void Init(const std::string& log_file_path);  // Also append to a file
  static void SetLevel(Level level);
  static Level GetLevel();

  // False when LOG_DEBUG is compiled out (no SHIELD_DEBUG_BUILD)
  static bool DebugCompiledIn();

  // Accepts DEBUG, INFO, WARN, WARNING, ERROR (any case).
  // Returns false and leaves the level untouched on anything else.
  static bool SetLevelFromString(const std::string& name);

  static void Log(Level level, const std::string& component, const std::string& message);

  // Convenience methods
  static void Debug(const std::string& component, const std::string& message);
  static void Info(const std::string& component, const std::string& message);
  static void Warn(const std::string& component, const std::string& message);
  static void Error(const std::string& component, const std::string& message);

private:
  static std::atomic<Level> current_level_;
  static std::string GetTimestamp();
  static std::string LevelToString(Level level);
};

} // namespace log
} // namespace shield

// LOG_DEBUG only compiles in debug builds
#ifdef SHIELD_DEBUG_BUILD
  #define LOG_DEBUG(component, msg) shield::log::Logger::Debug(component, msg)
#else
  #define LOG_DEBUG(component, msg) ((void)0)
#endif

#define LOG_INFO(component, msg) shield::log::Logger::Info(component, msg)
#define LOG_WARN(component, msg) shield::log::Logger::Warn(component, msg)
#define LOG_ERROR(component, msg) shield::log::Logger::Error(component, msg)

#endif  // SHIELD_LOGGER_H_
