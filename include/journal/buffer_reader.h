#ifndef BUFFER_READER_H
#define BUFFER_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Bounds-checked readers for big-endian binary fields, EBCDIC character
// fields and EBCDIC zoned decimals. Every reader throws
// JournalDecodeException rather than read past the end of data.
namespace BufferReader {

void requireBytes(const std::vector<uint8_t> &data, size_t offset,
                  size_t length, const char *field);

uint16_t readUInt16(const std::vector<uint8_t> &data, size_t offset,
                    const char *field);
uint32_t readUInt32(const std::vector<uint8_t> &data, size_t offset,
                    const char *field);
uint64_t readUInt64(const std::vector<uint8_t> &data, size_t offset,
                    const char *field);

// Converts from EBCDIC and strips trailing blanks.
std::string readString(const std::vector<uint8_t> &data, size_t offset,
                       size_t length, const char *field);

// An all blank field reads as zero.
uint64_t readZoned(const std::vector<uint8_t> &data, size_t offset,
                   size_t length, const char *field);

} // namespace BufferReader

#endif
