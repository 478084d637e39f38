#include "journal/buffer_reader.h"
#include "journal/journal_exceptions.h"
#include "utils/ebcdic.h"
#include "utils/string_utils.h"
#include <limits>

namespace BufferReader {

void requireBytes(const std::vector<uint8_t> &data, size_t offset,
                  size_t length, const char *field) {
  if (offset > data.size() || length > data.size() - offset) {
    throw JournalDecodeException(
        std::string("Buffer too short for ") + field + ": need " +
        std::to_string(length) + " bytes at offset " + std::to_string(offset) +
        ", buffer length " + std::to_string(data.size()));
  }
}

uint16_t readUInt16(const std::vector<uint8_t> &data, size_t offset,
                    const char *field) {
  requireBytes(data, offset, 2, field);
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint32_t readUInt32(const std::vector<uint8_t> &data, size_t offset,
                    const char *field) {
  requireBytes(data, offset, 4, field);
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

uint64_t readUInt64(const std::vector<uint8_t> &data, size_t offset,
                    const char *field) {
  requireBytes(data, offset, 8, field);
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value = (value << 8) | data[offset + i];
  }
  return value;
}

std::string readString(const std::vector<uint8_t> &data, size_t offset,
                       size_t length, const char *field) {
  requireBytes(data, offset, length, field);
  return StringUtils::trimRight(
      EbcdicUtils::toAscii(data.data() + offset, length));
}

uint64_t readZoned(const std::vector<uint8_t> &data, size_t offset,
                   size_t length, const char *field) {
  requireBytes(data, offset, length, field);

  bool blank = true;
  for (size_t i = 0; i < length; ++i) {
    uint8_t b = data[offset + i];
    if (b != EbcdicUtils::EBCDIC_SPACE && b != 0x00) {
      blank = false;
      break;
    }
  }
  if (blank) {
    return 0;
  }

  uint64_t value = 0;
  for (size_t i = 0; i < length; ++i) {
    uint8_t b = data[offset + i];
    uint8_t zone = b >> 4;
    uint8_t digit = b & 0x0F;
    bool last = (i + 1 == length);
    // the final zone nibble carries the sign: F or C positive, D negative
    bool validZone = zone == 0x0F || (last && zone == 0x0C);
    if (!validZone || digit > 9) {
      throw JournalDecodeException(std::string("Invalid zoned digit in ") +
                                   field + " at offset " +
                                   std::to_string(offset + i));
    }
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      throw JournalDecodeException(std::string("Zoned value overflow in ") +
                                   field);
    }
    value = value * 10 + digit;
  }
  return value;
}

} // namespace BufferReader
