#include "core/database_log_writer.h"
#include <iostream>

namespace {

constexpr size_t MAX_LABEL_LENGTH = 50;
constexpr size_t MAX_FUNCTION_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

constexpr const char *INSERT_STATEMENT = "journal_log_insert";

size_t utf8SequenceLength(unsigned char lead) {
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 0;
}

} // namespace

DatabaseLogWriter::DatabaseLogWriter(std::string connectionString)
    : connectionString_(std::move(connectionString)) {
  std::lock_guard<std::mutex> lock(mutex_);
  connect();
}

std::string DatabaseLogWriter::clipUTF8(std::string text, size_t maxBytes) {
  if (text.size() <= maxBytes)
    return text;
  size_t cut = maxBytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  text.resize(cut);
  return text;
}

std::string DatabaseLogWriter::sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    if ((c >= 0x20 && c <= 0x7E) || c == '\n' || c == '\r' || c == '\t') {
      result += static_cast<char>(c);
      ++i;
      continue;
    }

    size_t length = utf8SequenceLength(c);
    bool valid = length > 0 && i + length <= input.size();
    for (size_t k = 1; valid && k < length; ++k) {
      valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    }
    if (valid) {
      result.append(input, i, length);
      i += length;
    } else {
      ++i;
    }
  }
  return result;
}

bool DatabaseLogWriter::connect() {
  nextAttempt_ = std::chrono::steady_clock::now() + RECONNECT_INTERVAL;
  try {
    auto conn = std::make_unique<pqxx::connection>(connectionString_);
    conn->prepare(INSERT_STATEMENT,
                  "INSERT INTO metadata.logs (ts, level, category, function, "
                  "message) VALUES (NOW(), $1, $2, $3, $4)");
    conn_ = std::move(conn);
    return true;
  } catch (const std::exception &e) {
    conn_.reset();
    std::cerr << "DatabaseLogWriter: cannot open log connection: " << e.what()
              << std::endl;
    return false;
  }
}

bool DatabaseLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_)
    return false;

  if (!conn_ || !conn_->is_open()) {
    conn_.reset();
    if (std::chrono::steady_clock::now() < nextAttempt_ || !connect())
      return false;
  }

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared(INSERT_STATEMENT,
                      clipUTF8(sanitizeUTF8(record.level), MAX_LABEL_LENGTH),
                      clipUTF8(sanitizeUTF8(record.category), MAX_LABEL_LENGTH),
                      clipUTF8(sanitizeUTF8(record.function), MAX_FUNCTION_LENGTH),
                      clipUTF8(sanitizeUTF8(record.message), MAX_MESSAGE_LENGTH));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    conn_.reset();
    std::cerr << "DatabaseLogWriter: connection broken: " << e.what()
              << std::endl;
  } catch (const pqxx::sql_error &e) {
    std::cerr << "DatabaseLogWriter: SQL error writing log row: " << e.what()
              << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: failed to write log row: " << e.what()
              << std::endl;
  }
  return false;
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  closed_ = true;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !closed_ && conn_ && conn_->is_open();
}
