#include "journal/entry_dump_writer.h"
#include "core/logger.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <memory>

namespace {

struct FileCloser {
  void operator()(std::FILE *file) const {
    if (file)
      std::fclose(file);
  }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

} // namespace

EntryDumpWriter::EntryDumpWriter(std::string folder)
    : folder_(std::move(folder)) {}

std::string EntryDumpWriter::timestampPrefix() const {
  auto now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  struct tm tm_buf;
  localtime_r(&now, &tm_buf);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%y%m%d-%H%M", &tm_buf);
  return buffer;
}

std::optional<std::filesystem::path>
EntryDumpWriter::dump(const std::vector<uint8_t> &data, size_t offset,
                      const std::string &headerText) const {
  if (!isEnabled()) {
    return std::nullopt;
  }

  try {
    std::error_code ec;
    std::filesystem::create_directories(folder_, ec);
    if (ec) {
      Logger::error(LogCategory::DIAGNOSTICS, "EntryDumpWriter::dump",
                    "Cannot create dump folder " + folder_ + ": " +
                        ec.message());
      return std::nullopt;
    }

    std::string prefix = timestampPrefix();
    std::filesystem::path path;
    FilePtr file;
    for (int i = 0; i < MAX_FILES_PER_MINUTE && !file; ++i) {
      path = std::filesystem::path(folder_) / (prefix + "-" + std::to_string(i));
      file.reset(std::fopen(path.c_str(), "wbx"));
    }
    if (!file) {
      Logger::error(LogCategory::DIAGNOSTICS, "EntryDumpWriter::dump",
                    "No free dump file name for " + prefix + " in " +
                        folder_);
      return std::nullopt;
    }

    size_t start = offset < data.size() ? offset : data.size();
    size_t length = data.size() - start;
    if (length > 0 &&
        std::fwrite(data.data() + start, 1, length, file.get()) != length) {
      Logger::error(LogCategory::DIAGNOSTICS, "EntryDumpWriter::dump",
                    "Short write to " + path.string());
      return std::nullopt;
    }
    file.reset();

    std::filesystem::path textPath = path;
    textPath += ".txt";
    std::ofstream text(textPath);
    if (!text.is_open()) {
      Logger::error(LogCategory::DIAGNOSTICS, "EntryDumpWriter::dump",
                    "Cannot open " + textPath.string());
      return std::nullopt;
    }
    text << headerText << "\n";
    text << "dumped: " << length << "\n";
    text << "total length: " << data.size() << "\n";

    Logger::info(LogCategory::DIAGNOSTICS, "EntryDumpWriter::dump",
                 "Dumped " + std::to_string(length) + " bytes to " +
                     path.string());
    return path;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DIAGNOSTICS, "EntryDumpWriter::dump",
                  "Failed to dump entry: " + std::string(e.what()));
    return std::nullopt;
  }
}
