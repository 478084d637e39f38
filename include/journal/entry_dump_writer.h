#ifndef ENTRY_DUMP_WRITER_H
#define ENTRY_DUMP_WRITER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Writes the raw buffer of an entry that failed to decode, plus a .txt
// sibling describing it, so the failure can be replayed offline.
class EntryDumpWriter {
public:
  static constexpr int MAX_FILES_PER_MINUTE = 100;

  explicit EntryDumpWriter(std::string folder);

  bool isEnabled() const { return !folder_.empty(); }

  // Dumps data[offset..end). Returns the binary file written, or nothing
  // when dumping is disabled or failed. Never throws.
  std::optional<std::filesystem::path>
  dump(const std::vector<uint8_t> &data, size_t offset,
       const std::string &headerText) const;

private:
  std::string folder_;

  std::string timestampPrefix() const;
};

#endif
