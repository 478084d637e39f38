#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

FileLogWriter::FileLogWriter(std::string path, size_t maxBytes, int maxBackups)
    : path_(std::move(path)), maxBytes_(maxBytes), maxBackups_(maxBackups) {
  out_.open(path_, std::ios::app);
}

bool FileLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_.is_open())
    return false;

  rotateIfFull();
  if (!out_.is_open())
    return false;

  out_ << record.formatted << '\n';
  return out_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open())
    out_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return out_.is_open();
}

std::string FileLogWriter::backupName(int index) const {
  return path_ + "." + std::to_string(index);
}

// Rename failures keep writing to the current file.
void FileLogWriter::rotateIfFull() {
  out_.flush();
  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (ec || size < maxBytes_)
    return;

  out_.close();
  std::filesystem::remove(backupName(maxBackups_), ec);
  for (int i = maxBackups_ - 1; i > 0; --i) {
    if (std::filesystem::exists(backupName(i), ec))
      std::filesystem::rename(backupName(i), backupName(i + 1), ec);
  }
  std::filesystem::rename(path_, backupName(1), ec);
  out_.open(path_, std::ios::app);
}
