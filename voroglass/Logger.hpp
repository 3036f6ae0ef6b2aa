// Basic file and console logger.
// Based on https://www.geeksforgeeks.org/cpp/logging-system-in-cpp/

#pragma once

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace voroglass
{
// Log levels, combinable as a bitmask
enum class LogLevel : unsigned int
{
  Debug = 1,
  Info = 2,
  Warning = 4,
  Error = 8,
  Critical = 16
};

inline LogLevel operator|(LogLevel a, LogLevel b)
{
  return static_cast<LogLevel>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

inline LogLevel operator&(LogLevel a, LogLevel b)
{
  return static_cast<LogLevel>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

inline LogLevel& operator|=(LogLevel& a, LogLevel b)
{
  a = a | b;
  return a;
}

inline LogLevel& operator&=(LogLevel& a, LogLevel b)
{
  a = a & b;
  return a;
}

inline LogLevel operator~(LogLevel a) { return static_cast<LogLevel>(~static_cast<unsigned>(a)); }

class Logger
{
 private:
  LogLevel log_level = LogLevel::Info | LogLevel::Warning | LogLevel::Error | LogLevel::Critical;

 public:
  // Opens the log file in append mode
  Logger(const std::string& filename)
  {
    logFile.open(filename, std::ios::app);
    if (!logFile.is_open())
    {
      std::cerr << "Error opening log file." << std::endl;
    }
  }

  ~Logger() { logFile.close(); }

  void setLogLevel(LogLevel level, bool set = true)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (set)
    {
      log_level |= level;
    }
    else
    {
      log_level &= ~level;
    }
  }

  LogLevel getLogLevel() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_level;
  }

  bool isEnabled(LogLevel level) const { return static_cast<unsigned>(getLogLevel() & level) != 0; }

  // Logs a message with a given log level
  void log(LogLevel level, const std::string& message)
  {
    if (!isEnabled(level))
    {
      return;
    }
    time_t now = time(0);
    tm timeinfo {};
    localtime_r(&now, &timeinfo);
    char timestamp[20];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &timeinfo);

    std::ostringstream logEntry;
    logEntry << "[voroglass] [" << timestamp << "] " << levelToString(level) << ": " << message << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << logEntry.str();

    if (logFile.is_open())
    {
      logFile << logEntry.str();
      logFile.flush();
    }
  }

  void log(LogLevel level, const char* fmt, ...)
  {
    if (!isEnabled(level))
    {
      return;
    }
    va_list args;
    va_start(args, fmt);

    // Get the size needed
    va_list args_copy;
    va_copy(args_copy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (size < 0)
    {
      va_end(args);
      log(level, std::string("formatting error in log"));
      return;
    }

    std::vector<char> buffer(size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);

    log(level, std::string(buffer.data(), size));
  }

 private:
  std::ofstream logFile;
  mutable std::mutex mutex_;

  static std::string levelToString(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }
};

inline Logger logger("voroglass_logfile.txt");

#define VOROGLASS_DEBUG(msg)                                                                                           \
  {                                                                                                                    \
    std::stringstream ss;                                                                                              \
    ss << msg << " (" << __FILE__ << ": line " << __LINE__ << ")";                                                     \
    ::voroglass::logger.log(::voroglass::LogLevel::Debug, ss.str());                                                   \
  }

#define VOROGLASS_INFO(msg)                                                                                            \
  {                                                                                                                    \
    std::stringstream ss;                                                                                              \
    ss << msg << " (" << __FILE__ << ": line " << __LINE__ << ")";                                                     \
    ::voroglass::logger.log(::voroglass::LogLevel::Info, ss.str());                                                    \
  }

#define VOROGLASS_WARNING(msg)                                                                                         \
  {                                                                                                                    \
    std::stringstream ss;                                                                                              \
    ss << msg << " (" << __FILE__ << ": line " << __LINE__ << ")";                                                     \
    ::voroglass::logger.log(::voroglass::LogLevel::Warning, ss.str());                                                 \
  }

#define VOROGLASS_ERROR(msg)                                                                                           \
  {                                                                                                                    \
    std::stringstream ss;                                                                                              \
    ss << msg << " (" << __FILE__ << ": line " << __LINE__ << ")";                                                     \
    ::voroglass::logger.log(::voroglass::LogLevel::Error, ss.str());                                                   \
  }
}
