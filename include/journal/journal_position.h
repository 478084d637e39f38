#ifndef JOURNAL_POSITION_H
#define JOURNAL_POSITION_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

struct EntryHeader;

struct JournalReceiver {
  std::string name;
  std::string library;

  bool operator==(const JournalReceiver &other) const {
    return name == other.name && library == other.library;
  }
  bool operator!=(const JournalReceiver &other) const {
    return !(*this == other);
  }
};

// Resumable cursor into a journal. A position is either qualified by the
// receiver holding its sequence number or by the sequence number alone.
// processed records whether the entry at this exact position has already
// been handed downstream; it takes no part in equality.
class JournalPosition {
public:
  JournalPosition() = default;
  explicit JournalPosition(uint64_t sequenceNumber, bool processed = false);
  JournalPosition(uint64_t sequenceNumber, JournalReceiver receiver,
                  bool processed = false);

  uint64_t sequenceNumber() const { return sequenceNumber_; }
  // Sequence addressed streams have no separate byte offset; the sequence
  // number is the offset.
  uint64_t offset() const { return sequenceNumber_; }
  const std::optional<JournalReceiver> &receiver() const { return receiver_; }
  bool isReceiverQualified() const { return receiver_.has_value(); }
  bool processed() const { return processed_; }

  void setProcessed(bool processed) { processed_ = processed; }
  void setOffset(uint64_t sequenceNumber, bool processed);
  void setJournalReceiver(uint64_t sequenceNumber,
                          const JournalReceiver &receiver, bool processed);
  void setPosition(const JournalPosition &other);

  void advance(const EntryHeader &entry);
  JournalPosition advancedBy(const EntryHeader &entry) const;

  bool operator==(const JournalPosition &other) const;
  bool operator!=(const JournalPosition &other) const {
    return !(*this == other);
  }
  bool operator<(const JournalPosition &other) const {
    return sequenceNumber_ < other.sequenceNumber_;
  }
  bool operator<=(const JournalPosition &other) const {
    return !(other < *this);
  }

  std::string toString() const;

private:
  uint64_t sequenceNumber_{0};
  std::optional<JournalReceiver> receiver_;
  bool processed_{false};
};

// True when entry would leave prior exactly where it is and prior has
// already been emitted, i.e. the entry was delivered by an earlier fetch.
bool isAlreadyProcessed(const JournalPosition &prior, const EntryHeader &entry);

void to_json(json &j, const JournalPosition &position);
void from_json(const json &j, JournalPosition &position);

// Inclusive bounds of fetchable journal data. start == end means there is
// nothing new to read.
struct PositionRange {
  JournalPosition start;
  JournalPosition end;

  PositionRange(JournalPosition rangeStart, JournalPosition rangeEnd);

  bool isEmpty() const { return start == end; }
};

#endif
