#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Inserts log rows into metadata.logs. A broken connection is dropped and
// reopened on a later write, at most once per RECONNECT_INTERVAL.
class DatabaseLogWriter : public ILogWriter {
public:
  static constexpr std::chrono::seconds RECONNECT_INTERVAL{30};

  explicit DatabaseLogWriter(std::string connectionString);
  ~DatabaseLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;

  // Removes bytes that do not form valid UTF-8; text decoded from EBCDIC
  // can carry unmappable characters.
  static std::string sanitizeUTF8(const std::string &input);
  // Truncates to at most maxBytes without splitting a UTF-8 sequence.
  static std::string clipUTF8(std::string text, size_t maxBytes);

private:
  bool connect();

  std::string connectionString_;
  std::unique_ptr<pqxx::connection> conn_;
  bool closed_{false};
  std::chrono::steady_clock::time_point nextAttempt_{};
  mutable std::mutex mutex_;
};

#endif
