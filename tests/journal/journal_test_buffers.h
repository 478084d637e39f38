#ifndef JOURNAL_TEST_BUFFERS_H
#define JOURNAL_TEST_BUFFERS_H

#include "journal/journal_retrieval_service.h"
#include "utils/ebcdic.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Builders for RJNE0200 receiver variables laid out the way the retrieval
// service returns them.
namespace TestBuffers {

struct TestEntry {
  uint64_t sequence{0};
  std::optional<JournalReceiver> receiver;
  std::string code{"R"};
  std::string type{"PT"};
  std::string file{"CUSTOMER"};
  std::string library{"SALES"};
  std::vector<uint8_t> payload;
};

inline void putBE32(std::vector<uint8_t> &out, size_t at, uint32_t value) {
  out[at] = static_cast<uint8_t>(value >> 24);
  out[at + 1] = static_cast<uint8_t>(value >> 16);
  out[at + 2] = static_cast<uint8_t>(value >> 8);
  out[at + 3] = static_cast<uint8_t>(value);
}

inline void putBE64(std::vector<uint8_t> &out, size_t at, uint64_t value) {
  putBE32(out, at, static_cast<uint32_t>(value >> 32));
  putBE32(out, at + 4, static_cast<uint32_t>(value));
}

inline void putChar(std::vector<uint8_t> &out, size_t at,
                    const std::string &value, size_t width) {
  std::string padded = StringUtils::padRight(value, width);
  for (size_t i = 0; i < width; ++i)
    out[at + i] = EbcdicUtils::encode(padded[i]);
}

inline void putZoned(std::vector<uint8_t> &out, size_t at, uint64_t value,
                     size_t width) {
  for (size_t i = 0; i < width; ++i) {
    out[at + width - 1 - i] =
        static_cast<uint8_t>(EbcdicUtils::EBCDIC_ZERO + value % 10);
    value /= 10;
  }
}

inline std::vector<uint8_t> firstHeader(uint32_t totalBytes,
                                        uint32_t firstOffset, uint32_t count,
                                        char continuation,
                                        const std::string &receiver = "",
                                        const std::string &library = "",
                                        uint64_t sequence = 0) {
  std::vector<uint8_t> header(64, EbcdicUtils::EBCDIC_SPACE);
  putBE32(header, 0, totalBytes);
  putBE32(header, 4, firstOffset);
  putBE32(header, 8, count);
  putChar(header, 12, std::string(1, continuation), 1);
  putChar(header, 13, receiver, 10);
  putChar(header, 23, library, 10);
  if (sequence > 0)
    putZoned(header, 33, sequence, 20);
  return header;
}

inline std::vector<uint8_t> entry(const TestEntry &e) {
  constexpr size_t HEADER = 228;
  constexpr size_t RECEIVER_INFO = 34;
  size_t receiverOffset = e.receiver ? HEADER : 0;
  size_t dataOffset = HEADER + (e.receiver ? RECEIVER_INFO : 0);
  size_t length = dataOffset + 16 + e.payload.size();
  length += (4 - length % 4) % 4;

  std::vector<uint8_t> out(length, EbcdicUtils::EBCDIC_SPACE);
  for (size_t i = 0; i < 98; ++i)
    out[i] = 0;
  putBE32(out, 0, 0);
  putBE32(out, 8, static_cast<uint32_t>(dataOffset));
  putBE32(out, 20, static_cast<uint32_t>(receiverOffset));
  putBE64(out, 24, e.sequence);
  putBE64(out, 56, e.sequence * 10);
  putChar(out, 98, e.code, 1);
  putChar(out, 99, e.type, 2);
  putChar(out, 101, "QZDASOINIT", 10);
  putChar(out, 111, "QUSER", 10);
  putChar(out, 121, "123456", 6);
  putChar(out, 127, "APPPGM", 10);
  putChar(out, 137, "APPLIB", 10);
  putChar(out, 157, e.file + std::string(10 - e.file.size(), ' ') + e.library,
          30);
  putChar(out, 187, "APPUSER", 10);
  putChar(out, 208, "S1234567", 8);
  if (e.receiver) {
    putChar(out, HEADER, e.receiver->name, 10);
    putChar(out, HEADER + 10, e.receiver->library, 10);
    putChar(out, HEADER + 20, "*SYSBAS", 10);
    putBE32(out, HEADER + 30, 1);
  }
  putZoned(out, dataOffset, e.payload.size(), 5);
  std::copy(e.payload.begin(), e.payload.end(),
            out.begin() + dataOffset + 16);
  return out;
}

// Header followed by the chained entries. continuation '1' adds the
// continuation position.
inline std::vector<uint8_t>
block(const std::vector<TestEntry> &entries, char continuation = '0',
      const std::string &nextReceiver = "", const std::string &nextLibrary = "",
      uint64_t nextSequence = 0) {
  std::vector<uint8_t> body;
  for (size_t i = 0; i < entries.size(); ++i) {
    std::vector<uint8_t> bytes = entry(entries[i]);
    if (i + 1 < entries.size())
      putBE32(bytes, 0, static_cast<uint32_t>(bytes.size()));
    body.insert(body.end(), bytes.begin(), bytes.end());
  }
  uint32_t total = static_cast<uint32_t>(64 + body.size());
  std::vector<uint8_t> out = firstHeader(
      total, entries.empty() ? 0 : 64, static_cast<uint32_t>(entries.size()),
      continuation, nextReceiver, nextLibrary, nextSequence);
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

inline DetailedJournalReceiver receiver(const std::string &name,
                                        uint64_t first, uint64_t last,
                                        const std::string &status) {
  return DetailedJournalReceiver{JournalReceiver{name, "JRNLIB"}, first, last,
                                 status, "2026-01-01-00.00.00"};
}

} // namespace TestBuffers

#endif
