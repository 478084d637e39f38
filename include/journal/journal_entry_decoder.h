#ifndef JOURNAL_ENTRY_DECODER_H
#define JOURNAL_ENTRY_DECODER_H

#include "journal/rjne0200_decoder.h"
#include <cstddef>
#include <cstdint>
#include <vector>

// Turns the entry-specific part of one journal entry into T. offset is the
// start of the entry inside data; the header has already been decoded.
template <typename T> class IJournalEntryDecoder {
public:
  virtual ~IJournalEntryDecoder() = default;

  virtual T decode(const EntryHeader &entryHeader,
                   const std::vector<uint8_t> &data, size_t offset) const = 0;
};

// Returns the entry-specific data bytes as they are, without the 5 digit
// zoned length and 11 reserved bytes that precede them.
class RawEntryDataDecoder : public IJournalEntryDecoder<std::vector<uint8_t>> {
public:
  static constexpr size_t LENGTH_FIELD_SIZE = 5;
  static constexpr size_t RESERVED_SIZE = 11;

  std::vector<uint8_t> decode(const EntryHeader &entryHeader,
                              const std::vector<uint8_t> &data,
                              size_t offset) const override;
};

#endif
