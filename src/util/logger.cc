#include "util/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <fcntl.h>   // for open()
#include <unistd.h>  // for write(), close()

namespace shield {
namespace log {

#ifdef SHIELD_DEBUG_BUILD
std::atomic<Level> Logger::current_level_{DEBUG};
#else
std::atomic<Level> Logger::current_level_{INFO};
#endif

static std::mutex log_mutex;
static std::string log_file_path_global;

void Logger::Init() {
  std::lock_guard<std::mutex> lock(log_mutex);
  current_level_.store(DebugCompiledIn() ? DEBUG : INFO, std::memory_order_relaxed);
  log_file_path_global.clear();
}

void Logger::Init(const std::string& log_file_path) {
  Init();

  // Open the file once so a bad path is reported at startup, not silently per line
  int fd = open(log_file_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
  if (fd < 0) {
    std::cerr << "[Logger] ERROR: Failed to open log file: " << log_file_path << std::endl;
    return;
  }
  close(fd);

  std::lock_guard<std::mutex> lock(log_mutex);
  log_file_path_global = log_file_path;
}

void Logger::SetLevel(Level level) {
  current_level_.store(level, std::memory_order_relaxed);
}

Level Logger::GetLevel() {
  return current_level_.load(std::memory_order_relaxed);
}

bool Logger::DebugCompiledIn() {
#ifdef SHIELD_DEBUG_BUILD
  return true;
#else
  return false;
#endif
}

bool Logger::SetLevelFromString(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") {
    SetLevel(DEBUG);
  } else if (upper == "INFO") {
    SetLevel(INFO);
  } else if (upper == "WARN" || upper == "WARNING") {
    SetLevel(WARN);
  } else if (upper == "ERROR") {
    SetLevel(ERROR);
  } else {
    return false;
  }
  return true;
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  auto timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LevelToString(Level level) {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    default:    return "UNKNOWN";
  }
}

void Logger::Log(Level level, const std::string& component, const std::string& message) {
  if (level < current_level_.load(std::memory_order_relaxed)) {
    return;
  }

  std::string log_line = "[" + GetTimestamp() + "] " +
                         "[" + LevelToString(level) + "] " +
                         "[" + component + "] " +
                         message + "\n";

  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << log_line;

  // Reopened per line with O_APPEND so several processes can share one file
  if (!log_file_path_global.empty()) {
    int fd = open(log_file_path_global.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd >= 0) {
      ssize_t bytes_written = write(fd, log_line.c_str(), log_line.length());
      (void)bytes_written;  // logging must not fail the caller
      close(fd);
    }
  }
}

void Logger::Debug(const std::string& component, const std::string& message) {
  Log(DEBUG, component, message);
}

void Logger::Info(const std::string& component, const std::string& message) {
  Log(INFO, component, message);
}

void Logger::Warn(const std::string& component, const std::string& message) {
  Log(WARN, component, message);
}

void Logger::Error(const std::string& component, const std::string& message) {
  Log(ERROR, component, message);
}

} // namespace log
} // namespace shield
