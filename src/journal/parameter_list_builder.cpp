#include "journal/parameter_list_builder.h"
#include "utils/ebcdic.h"
#include "utils/string_utils.h"
#include <sstream>

namespace {

void appendInt32(std::vector<uint8_t> &out, int32_t value) {
  uint32_t v = static_cast<uint32_t>(value);
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void appendChar(std::vector<uint8_t> &out, const std::string &value,
                size_t width) {
  EbcdicUtils::appendEncoded(out, StringUtils::padRight(value, width));
}

// {record length, key, data length, data} padded to a 4 byte boundary.
void appendRecord(std::vector<uint8_t> &out, int32_t key,
                  const std::vector<uint8_t> &data) {
  constexpr size_t RECORD_HEADER = 12;
  size_t length = RECORD_HEADER + data.size();
  size_t padding = (4 - length % 4) % 4;

  appendInt32(out, static_cast<int32_t>(length + padding));
  appendInt32(out, key);
  appendInt32(out, static_cast<int32_t>(data.size()));
  out.insert(out.end(), data.begin(), data.end());
  out.insert(out.end(), padding, EbcdicUtils::EBCDIC_SPACE);
}

std::vector<uint8_t> charData(const std::string &value, size_t width) {
  std::vector<uint8_t> data;
  appendChar(data, value, width);
  return data;
}

} // namespace

ParameterListBuilder &
ParameterListBuilder::withJournal(const std::string &journalName,
                                  const std::string &journalLibrary) {
  journal_.journalName = StringUtils::toUpper(journalName);
  journal_.journalLibrary = StringUtils::toUpper(journalLibrary);
  return *this;
}

void ParameterListBuilder::init() {
  receiverRange_.reset();
  startingSequence_.reset();
  endingSequence_.reset();
  entryType_.reset();
  files_.clear();
}

ParameterListBuilder &
ParameterListBuilder::withJournalEntryType(JournalEntryType type) {
  entryType_ = type;
  return *this;
}

ParameterListBuilder &
ParameterListBuilder::withFileFilters(const std::vector<FileFilter> &files) {
  files_ = files;
  return *this;
}

ParameterListBuilder &
ParameterListBuilder::withStartingSequence(uint64_t sequence) {
  startingSequence_ = sequence;
  return *this;
}

ParameterListBuilder &ParameterListBuilder::withReceivers(
    const std::string &startReceiver, const std::string &startLibrary,
    const std::string &endReceiver, const std::string &endLibrary) {
  receiverRange_ = StringUtils::padRight(startReceiver, NAME_LENGTH) +
                   StringUtils::padRight(startLibrary, NAME_LENGTH) +
                   StringUtils::padRight(endReceiver, NAME_LENGTH) +
                   StringUtils::padRight(endLibrary, NAME_LENGTH);
  return *this;
}

ParameterListBuilder &ParameterListBuilder::withEnd(uint64_t sequence) {
  endingSequence_ = sequence;
  return *this;
}

ParameterListBuilder &
ParameterListBuilder::fromPositionToEnd(const JournalPosition &position) {
  if (position.isReceiverQualified()) {
    receiverRange_ =
        StringUtils::padRight(position.receiver()->name, NAME_LENGTH) +
        StringUtils::padRight(position.receiver()->library, NAME_LENGTH) +
        StringUtils::padRight("*CURRENT", 2 * NAME_LENGTH);
  } else {
    receiverRange_ = StringUtils::padRight("*CURCHAIN", RECEIVER_RANGE_LENGTH);
  }
  startingSequence_ = position.sequenceNumber();
  endingSequence_.reset();
  return *this;
}

std::vector<uint8_t> ParameterListBuilder::buildSelection() const {
  std::vector<uint8_t> records;
  int32_t count = 0;

  if (receiverRange_) {
    appendRecord(records, KEY_RECEIVER_RANGE,
                 charData(*receiverRange_, RECEIVER_RANGE_LENGTH));
    ++count;
  }
  if (startingSequence_) {
    appendRecord(records, KEY_STARTING_SEQUENCE,
                 charData(std::to_string(*startingSequence_), SEQUENCE_LENGTH));
    ++count;
  }
  if (endingSequence_) {
    appendRecord(records, KEY_ENDING_SEQUENCE,
                 charData(std::to_string(*endingSequence_), SEQUENCE_LENGTH));
    ++count;
  }
  if (entryType_) {
    std::vector<uint8_t> data;
    appendInt32(data, 1);
    appendChar(data, ::toString(*entryType_), NAME_LENGTH);
    appendRecord(records, KEY_ENTRY_TYPES, data);
    ++count;
  }
  if (!files_.empty()) {
    std::vector<uint8_t> data;
    appendInt32(data, static_cast<int32_t>(files_.size()));
    for (const auto &file : files_) {
      appendChar(data, StringUtils::toUpper(file.table), NAME_LENGTH);
      appendChar(data, StringUtils::toUpper(file.schema), NAME_LENGTH);
      appendChar(data, file.member, NAME_LENGTH);
    }
    appendRecord(records, KEY_FILES, data);
    ++count;
  }

  std::vector<uint8_t> selection;
  selection.reserve(4 + records.size());
  appendInt32(selection, count);
  selection.insert(selection.end(), records.begin(), records.end());
  return selection;
}

RetrievalRequest ParameterListBuilder::build(size_t bufferSize) const {
  RetrievalRequest request;
  request.journal = journal_;
  request.bufferSize = bufferSize;
  request.selection = buildSelection();
  request.description = toString();
  return request;
}

std::string ParameterListBuilder::toString() const {
  std::ostringstream oss;
  oss << "ParameterListBuilder [journal=" << journal_.qualifiedName();
  if (receiverRange_)
    oss << ", receivers=" << StringUtils::trim(*receiverRange_);
  if (startingSequence_)
    oss << ", start=" << *startingSequence_;
  if (endingSequence_)
    oss << ", end=" << *endingSequence_;
  if (entryType_)
    oss << ", entryType=" << ::toString(*entryType_);
  if (!files_.empty()) {
    oss << ", files=";
    for (size_t i = 0; i < files_.size(); ++i) {
      if (i > 0)
        oss << ",";
      oss << files_[i].schema << "/" << files_[i].table;
    }
  }
  oss << "]";
  return oss.str();
}
