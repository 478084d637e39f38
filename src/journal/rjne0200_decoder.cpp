#include "journal/rjne0200_decoder.h"
#include "journal/buffer_reader.h"
#include "journal/journal_exceptions.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <sstream>

using BufferReader::readString;
using BufferReader::readUInt32;
using BufferReader::readUInt64;
using BufferReader::readZoned;

namespace {

// FirstHeader field offsets
constexpr size_t FH_BYTES_RETURNED = 0;
constexpr size_t FH_OFFSET_FIRST_ENTRY = 4;
constexpr size_t FH_ENTRIES_RETRIEVED = 8;
constexpr size_t FH_CONTINUATION = 12;
constexpr size_t FH_CONT_RECEIVER = 13;
constexpr size_t FH_CONT_LIBRARY = 23;
constexpr size_t FH_CONT_SEQUENCE = 33;
constexpr size_t FH_CONT_SEQUENCE_LENGTH = 20;

// EntryHeader field offsets, relative to the start of the entry
constexpr size_t EH_NEXT = 0;
constexpr size_t EH_NULL_VALUES = 4;
constexpr size_t EH_ENTRY_SPECIFIC = 8;
constexpr size_t EH_TRANSACTION_ID = 12;
constexpr size_t EH_LUW = 16;
constexpr size_t EH_RECEIVER = 20;
constexpr size_t EH_SEQUENCE = 24;
constexpr size_t EH_TIMESTAMP = 32;
constexpr size_t EH_THREAD = 40;
constexpr size_t EH_SYSTEM_SEQUENCE = 48;
constexpr size_t EH_COUNT_RRN = 56;
constexpr size_t EH_COMMIT_CYCLE = 64;
constexpr size_t EH_JOURNAL_CODE = 98;
constexpr size_t EH_ENTRY_TYPE = 99;
constexpr size_t EH_JOB_NAME = 101;
constexpr size_t EH_USER_NAME = 111;
constexpr size_t EH_JOB_NUMBER = 121;
constexpr size_t EH_PROGRAM = 127;
constexpr size_t EH_PROGRAM_LIBRARY = 137;
constexpr size_t EH_OBJECT = 157;
constexpr size_t EH_USER_PROFILE = 187;
constexpr size_t EH_SYSTEM_NAME = 208;

constexpr size_t NAME_LENGTH = 10;

} // namespace

std::string toString(OffsetStatus status) {
  switch (status) {
  case OffsetStatus::MORE_DATA_SAME_OFFSET:
    return "MORE_DATA_SAME_OFFSET";
  case OffsetStatus::MORE_DATA_NEW_OFFSET:
    return "MORE_DATA_NEW_OFFSET";
  case OffsetStatus::NO_MORE_DATA:
    return "NO_MORE_DATA";
  }
  return "UNKNOWN";
}

FirstHeader::FirstHeader(uint32_t totalBytes, uint32_t offset, uint32_t size,
                         OffsetStatus status,
                         std::optional<JournalPosition> nextPosition)
    : totalBytes(totalBytes), offset(offset), size(size), status(status),
      nextPosition(std::move(nextPosition)) {}

FirstHeader
FirstHeader::withCurrentJournalPosition(const JournalPosition &position) const {
  FirstHeader copy(*this);
  copy.currentJournalPosition = position;
  return copy;
}

bool FirstHeader::hasFutureDataAvailable() const {
  return status == OffsetStatus::MORE_DATA_NEW_OFFSET;
}

std::string FirstHeader::toString() const {
  std::ostringstream oss;
  oss << "FirstHeader [totalBytes=" << totalBytes << ", offset=" << offset
      << ", size=" << size << ", status=" << ::toString(status)
      << ", nextPosition="
      << (nextPosition ? nextPosition->toString() : "<null>")
      << ", currentJournalPosition="
      << (currentJournalPosition ? currentJournalPosition->toString()
                                 : "<null>")
      << "]";
  return oss.str();
}

std::string EntryHeader::objectName() const {
  return StringUtils::trim(object.substr(0, std::min<size_t>(10, object.size())));
}

std::string EntryHeader::objectLibrary() const {
  if (object.size() <= 10)
    return "";
  return StringUtils::trim(object.substr(10, 10));
}

std::string EntryHeader::toString() const {
  std::ostringstream oss;
  oss << "EntryHeader [sequenceNumber=" << sequenceNumber
      << ", journalCode=" << journalCode << ", entryType=" << entryType
      << ", object=" << object << ", countOrRrn=" << countOrRrn
      << ", commitCycleId=" << commitCycleId << ", job=" << jobNumber << "/"
      << userName << "/" << jobName << ", program=" << programLibrary << "/"
      << programName << ", userProfile=" << userProfile
      << ", systemName=" << systemName
      << ", nextEntryOffset=" << nextEntryOffset
      << ", entrySpecificDataOffset=" << entrySpecificDataOffset
      << ", nullValueOffset=" << nullValueOffset
      << ", receiverOffset=" << receiverOffset;
  if (receiver) {
    oss << ", receiver=" << receiver->library << "/" << receiver->name;
  }
  oss << "]";
  return oss.str();
}

FirstHeader FirstHeaderDecoder::decode(const std::vector<uint8_t> &data) const {
  BufferReader::requireBytes(data, 0, HEADER_SIZE, "first header");

  uint32_t totalBytes = readUInt32(data, FH_BYTES_RETURNED, "bytes returned");
  if (totalBytes > data.size()) {
    throw JournalDecodeException(
        "First header declares " + std::to_string(totalBytes) +
        " bytes but buffer holds " + std::to_string(data.size()));
  }
  uint32_t offset = readUInt32(data, FH_OFFSET_FIRST_ENTRY, "first entry offset");
  uint32_t size = readUInt32(data, FH_ENTRIES_RETRIEVED, "entries retrieved");

  std::string continuation =
      readString(data, FH_CONTINUATION, 1, "continuation handle");
  std::string receiver =
      readString(data, FH_CONT_RECEIVER, NAME_LENGTH, "continuation receiver");
  std::string library =
      readString(data, FH_CONT_LIBRARY, NAME_LENGTH, "continuation library");
  uint64_t sequence = readZoned(data, FH_CONT_SEQUENCE, FH_CONT_SEQUENCE_LENGTH,
                                "continuation sequence");

  if (continuation == "0") {
    return FirstHeader(totalBytes, offset, size,
                       size > 0 ? OffsetStatus::MORE_DATA_SAME_OFFSET
                                : OffsetStatus::NO_MORE_DATA);
  }
  if (continuation != "1") {
    throw JournalDecodeException("Unknown continuation handle '" +
                                 continuation + "'");
  }

  std::optional<JournalPosition> next;
  if (!receiver.empty()) {
    next = JournalPosition(sequence, JournalReceiver{receiver, library});
  } else if (sequence != 0) {
    next = JournalPosition(sequence);
  }
  return FirstHeader(totalBytes, offset, size,
                     OffsetStatus::MORE_DATA_NEW_OFFSET, next);
}

EntryHeader EntryHeaderDecoder::decode(const std::vector<uint8_t> &data,
                                       size_t offset) const {
  BufferReader::requireBytes(data, offset, ENTRY_HEADER_SIZE, "entry header");

  EntryHeader e;
  e.nextEntryOffset = readUInt32(data, offset + EH_NEXT, "next entry offset");
  e.nullValueOffset =
      readUInt32(data, offset + EH_NULL_VALUES, "null value offset");
  e.entrySpecificDataOffset =
      readUInt32(data, offset + EH_ENTRY_SPECIFIC, "entry specific offset");
  e.transactionIdentifierOffset =
      readUInt32(data, offset + EH_TRANSACTION_ID, "transaction id offset");
  e.logicalUnitOfWorkOffset =
      readUInt32(data, offset + EH_LUW, "logical unit of work offset");
  e.receiverOffset = readUInt32(data, offset + EH_RECEIVER, "receiver offset");
  e.sequenceNumber = readUInt64(data, offset + EH_SEQUENCE, "sequence number");
  e.systemTimestamp = readUInt64(data, offset + EH_TIMESTAMP, "timestamp");
  e.threadId = readUInt64(data, offset + EH_THREAD, "thread id");
  e.systemSequenceNumber =
      readUInt64(data, offset + EH_SYSTEM_SEQUENCE, "system sequence number");
  e.countOrRrn = readUInt64(data, offset + EH_COUNT_RRN, "count/rrn");
  e.commitCycleId = readUInt64(data, offset + EH_COMMIT_CYCLE, "commit cycle");
  e.journalCode = readString(data, offset + EH_JOURNAL_CODE, 1, "journal code");
  e.entryType = readString(data, offset + EH_ENTRY_TYPE, 2, "entry type");
  e.jobName = readString(data, offset + EH_JOB_NAME, NAME_LENGTH, "job name");
  e.userName = readString(data, offset + EH_USER_NAME, NAME_LENGTH, "user name");
  e.jobNumber = readString(data, offset + EH_JOB_NUMBER, 6, "job number");
  e.programName =
      readString(data, offset + EH_PROGRAM, NAME_LENGTH, "program name");
  e.programLibrary = readString(data, offset + EH_PROGRAM_LIBRARY, NAME_LENGTH,
                                "program library");
  e.object = readString(data, offset + EH_OBJECT, 30, "object");
  e.userProfile =
      readString(data, offset + EH_USER_PROFILE, NAME_LENGTH, "user profile");
  e.systemName = readString(data, offset + EH_SYSTEM_NAME, 8, "system name");

  if (e.receiverOffset != 0) {
    size_t receiverStart = offset + e.receiverOffset;
    BufferReader::requireBytes(data, receiverStart, RECEIVER_INFO_SIZE,
                               "receiver information");
    e.receiver = JournalReceiver{
        readString(data, receiverStart, NAME_LENGTH, "receiver name"),
        readString(data, receiverStart + NAME_LENGTH, NAME_LENGTH,
                   "receiver library")};
  }

  return e;
}
