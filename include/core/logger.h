#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  CONFIG = 2,
  JOURNAL = 3,
  DECODE = 4,
  DIAGNOSTICS = 5,
  OFFSETS = 6,
  UNKNOWN = 99
};

std::string toString(LogLevel level);
std::string toString(LogCategory category);

// Process wide logger. Records below the current level are dropped; the rest
// go to every registered sink. When no sink stores a record of level
// WARNING or above it is printed to stderr instead.
class Logger {
public:
  // Registers the metadata.logs sink and, when logFile is set, a rotating
  // file sink. Also picks up debug_level from metadata.config.
  static void initialize(const std::string &postgresConnectionString,
                         const std::string &logFile = "");
  static void addWriter(std::unique_ptr<ILogWriter> writer);
  static void shutdown();

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    log(LogLevel::DEBUG, category, function, message);
  }
  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    log(LogLevel::INFO, category, function, message);
  }
  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    log(LogLevel::WARNING, category, function, message);
  }
  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    log(LogLevel::ERROR, category, function, message);
  }
  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    log(LogLevel::CRITICAL, category, function, message);
  }

  static void log(LogLevel level, LogCategory category,
                  const std::string &function, const std::string &message);

  static void loadDebugConfig(const std::string &postgresConnectionString);
  static void setLogLevel(LogLevel level);
  // Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
  // Returns false and keeps the current level for anything else.
  static bool setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();

  static std::string formatRecord(const std::string &timestamp,
                                  LogLevel level, LogCategory category,
                                  const std::string &function,
                                  const std::string &message);

private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::mutex logMutex_;
  static LogLevel currentLogLevel_;
  static std::mutex levelMutex_;
};

#endif
