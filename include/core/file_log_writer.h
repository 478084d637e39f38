#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <fstream>
#include <mutex>
#include <string>

// Appends formatted lines to a file, keeping up to maxBackups rotated
// copies named file.1 .. file.N.
class FileLogWriter : public ILogWriter {
public:
  static constexpr size_t DEFAULT_MAX_BYTES = 10 * 1024 * 1024;
  static constexpr int DEFAULT_MAX_BACKUPS = 5;

  explicit FileLogWriter(std::string path,
                         size_t maxBytes = DEFAULT_MAX_BYTES,
                         int maxBackups = DEFAULT_MAX_BACKUPS);
  ~FileLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;

private:
  std::string backupName(int index) const;
  void rotateIfFull();

  std::string path_;
  size_t maxBytes_;
  int maxBackups_;
  std::ofstream out_;
  mutable std::mutex mutex_;
};

#endif
