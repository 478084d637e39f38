#ifndef RJNE0200_DECODER_H
#define RJNE0200_DECODER_H

#include "journal/journal_position.h"
#include "journal/retrieval_criteria.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class OffsetStatus {
  MORE_DATA_SAME_OFFSET,
  MORE_DATA_NEW_OFFSET,
  NO_MORE_DATA
};

std::string toString(OffsetStatus status);

// Header at the start of every RJNE0200 receiver variable.
struct FirstHeader {
  uint32_t totalBytes{0};
  uint32_t offset{0};
  // entries the service placed in the buffer; zero means no entry data
  uint32_t size{0};
  OffsetStatus status{OffsetStatus::NO_MORE_DATA};
  std::optional<JournalPosition> nextPosition;
  std::optional<JournalPosition> currentJournalPosition;

  FirstHeader() = default;
  FirstHeader(uint32_t totalBytes, uint32_t offset, uint32_t size,
              OffsetStatus status,
              std::optional<JournalPosition> nextPosition = std::nullopt);

  FirstHeader withCurrentJournalPosition(const JournalPosition &position) const;
  bool hasFutureDataAvailable() const;
  std::string toString() const;
};

struct EntryHeader {
  uint32_t nextEntryOffset{0};
  uint32_t nullValueOffset{0};
  uint32_t entrySpecificDataOffset{0};
  uint32_t transactionIdentifierOffset{0};
  uint32_t logicalUnitOfWorkOffset{0};
  uint32_t receiverOffset{0};
  uint64_t sequenceNumber{0};
  uint64_t systemTimestamp{0};
  uint64_t threadId{0};
  uint64_t systemSequenceNumber{0};
  uint64_t countOrRrn{0};
  uint64_t commitCycleId{0};
  std::string journalCode;
  std::string entryType;
  std::string jobName;
  std::string userName;
  std::string jobNumber;
  std::string programName;
  std::string programLibrary;
  std::string object;
  std::string userProfile;
  std::string systemName;
  std::optional<JournalReceiver> receiver;

  bool hasReceiver() const { return receiver.has_value(); }
  JournalCode code() const { return journalCodeFromString(journalCode); }
  JournalEntryType type() const {
    return journalEntryTypeFromString(entryType);
  }
  // object is "FILE      LIBRARY   MEMBER    " in system name form
  std::string objectName() const;
  std::string objectLibrary() const;

  std::string toString() const;
};

class FirstHeaderDecoder {
public:
  static constexpr size_t HEADER_SIZE = 64;

  FirstHeader decode(const std::vector<uint8_t> &data) const;
};

class EntryHeaderDecoder {
public:
  static constexpr size_t ENTRY_HEADER_SIZE = 228;
  static constexpr size_t RECEIVER_INFO_SIZE = 34;

  EntryHeader decode(const std::vector<uint8_t> &data, size_t offset) const;
};

#endif
