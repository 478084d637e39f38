#include "journal/journal_entry_decoder.h"
#include "journal/buffer_reader.h"

std::vector<uint8_t>
RawEntryDataDecoder::decode(const EntryHeader &entryHeader,
                            const std::vector<uint8_t> &data,
                            size_t offset) const {
  if (entryHeader.entrySpecificDataOffset == 0) {
    return {};
  }

  size_t start = offset + entryHeader.entrySpecificDataOffset;
  uint64_t length = BufferReader::readZoned(data, start, LENGTH_FIELD_SIZE,
                                            "entry specific data length");
  size_t dataStart = start + LENGTH_FIELD_SIZE + RESERVED_SIZE;
  BufferReader::requireBytes(data, dataStart, static_cast<size_t>(length),
                             "entry specific data");

  return std::vector<uint8_t>(data.begin() + dataStart,
                              data.begin() + dataStart + length);
}
