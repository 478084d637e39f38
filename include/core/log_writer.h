#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

// One log line as handed to the sinks. formatted is the rendered
// "[ts] [LEVEL] [CATEGORY] [function] message" form.
struct LogRecord {
  std::string level;
  std::string category;
  std::string function;
  std::string message;
  std::string formatted;
};

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  // False when the record could not be stored.
  virtual bool write(const LogRecord &record) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

#endif
