#include "core/logger.h"
#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include "utils/string_utils.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <pqxx/pqxx>
#include <sstream>
#include <unordered_map>

std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex_;
LogLevel Logger::currentLogLevel_ = LogLevel::INFO;
std::mutex Logger::levelMutex_;

namespace {

const std::unordered_map<std::string, LogLevel> levelNames = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  struct tm tm_buf;
  localtime_r(&seconds, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "."
      << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

} // namespace

std::string toString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string toString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::JOURNAL:
    return "JOURNAL";
  case LogCategory::DECODE:
    return "DECODE";
  case LogCategory::DIAGNOSTICS:
    return "DIAGNOSTICS";
  case LogCategory::OFFSETS:
    return "OFFSETS";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::formatRecord(const std::string &timestamp, LogLevel level,
                                 LogCategory category,
                                 const std::string &function,
                                 const std::string &message) {
  std::ostringstream oss;
  oss << "[" << timestamp << "] [" << toString(level) << "] ["
      << toString(category) << "]";
  if (!function.empty()) {
    oss << " [" << function << "]";
  }
  oss << " " << message;
  return oss.str();
}

void Logger::log(LogLevel level, LogCategory category,
                 const std::string &function, const std::string &message) {
  if (level < getCurrentLogLevel()) {
    return;
  }

  LogRecord record{toString(level), toString(category), function, message,
                   formatRecord(currentTimestamp(), level, category, function,
                                message)};

  std::lock_guard<std::mutex> lock(logMutex_);
  bool stored = false;
  for (auto &writer : writers_) {
    stored = writer->write(record) || stored;
  }
  if (!stored && level >= LogLevel::WARNING) {
    std::cerr << record.formatted << std::endl;
  }
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  if (!writer) {
    return;
  }
  std::lock_guard<std::mutex> lock(logMutex_);
  writers_.push_back(std::move(writer));
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex_);
  for (auto &writer : writers_) {
    writer->close();
  }
  writers_.clear();
}

// A level set from config.json survives an unreachable metadata database.
void Logger::loadDebugConfig(const std::string &postgresConnectionString) {
  if (postgresConnectionString.empty()) {
    return;
  }

  try {
    pqxx::connection conn(postgresConnectionString);
    pqxx::work txn(conn);
    auto result =
        txn.exec("SELECT value FROM metadata.config WHERE key = 'debug_level'");
    txn.commit();

    if (!result.empty() && !result[0][0].is_null()) {
      setLogLevel(result[0][0].as<std::string>());
    }
  } catch (const std::exception &e) {
    std::cerr << "Logger: could not load debug_level from metadata.config: "
              << e.what() << std::endl;
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(levelMutex_);
  currentLogLevel_ = level;
}

bool Logger::setLogLevel(const std::string &levelStr) {
  auto it = levelNames.find(StringUtils::toUpper(StringUtils::trim(levelStr)));
  if (it == levelNames.end()) {
    return false;
  }
  setLogLevel(it->second);
  return true;
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(levelMutex_);
  return currentLogLevel_;
}

void Logger::initialize(const std::string &postgresConnectionString,
                        const std::string &logFile) {
  loadDebugConfig(postgresConnectionString);

  if (!logFile.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(logFile);
    if (fileWriter->isOpen()) {
      addWriter(std::move(fileWriter));
    } else {
      std::cerr << "Logger: could not open log file " << logFile << std::endl;
    }
  }

  if (!postgresConnectionString.empty()) {
    auto dbWriter =
        std::make_unique<DatabaseLogWriter>(postgresConnectionString);
    if (!dbWriter->isOpen()) {
      std::cerr << "Logger: metadata.logs unreachable, retrying on later "
                   "writes"
                << std::endl;
    }
    addWriter(std::move(dbWriter));
  }
}
