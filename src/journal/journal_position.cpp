#include "journal/journal_position.h"
#include "journal/rjne0200_decoder.h"
#include <sstream>
#include <stdexcept>

JournalPosition::JournalPosition(uint64_t sequenceNumber, bool processed)
    : sequenceNumber_(sequenceNumber), processed_(processed) {}

JournalPosition::JournalPosition(uint64_t sequenceNumber,
                                 JournalReceiver receiver, bool processed)
    : sequenceNumber_(sequenceNumber), receiver_(std::move(receiver)),
      processed_(processed) {}

void JournalPosition::setOffset(uint64_t sequenceNumber, bool processed) {
  sequenceNumber_ = sequenceNumber;
  processed_ = processed;
}

void JournalPosition::setJournalReceiver(uint64_t sequenceNumber,
                                         const JournalReceiver &receiver,
                                         bool processed) {
  sequenceNumber_ = sequenceNumber;
  receiver_ = receiver;
  processed_ = processed;
}

void JournalPosition::setPosition(const JournalPosition &other) {
  sequenceNumber_ = other.sequenceNumber_;
  receiver_ = other.receiver_;
  processed_ = other.processed_;
}

// Receiver information only accompanies the first entry of a block and
// entries where the receiver changes, so an entry without it keeps the
// current qualification.
void JournalPosition::advance(const EntryHeader &entry) {
  if (entry.hasReceiver()) {
    setJournalReceiver(entry.sequenceNumber, *entry.receiver, true);
  } else {
    setOffset(entry.sequenceNumber, true);
  }
}

JournalPosition JournalPosition::advancedBy(const EntryHeader &entry) const {
  JournalPosition next(*this);
  next.advance(entry);
  return next;
}

bool JournalPosition::operator==(const JournalPosition &other) const {
  return sequenceNumber_ == other.sequenceNumber_ &&
         receiver_ == other.receiver_;
}

std::string JournalPosition::toString() const {
  std::ostringstream oss;
  oss << "JournalPosition [sequence=" << sequenceNumber_;
  if (receiver_) {
    oss << ", receiver=" << receiver_->library << "/" << receiver_->name;
  }
  oss << ", processed=" << (processed_ ? "true" : "false") << "]";
  return oss.str();
}

bool isAlreadyProcessed(const JournalPosition &prior,
                        const EntryHeader &entry) {
  if (!prior.processed()) {
    return false;
  }
  // A plain cursor carries no receiver to compare against
  if (!prior.isReceiverQualified()) {
    return entry.sequenceNumber == prior.sequenceNumber();
  }
  return prior.advancedBy(entry) == prior;
}

void to_json(json &j, const JournalPosition &position) {
  j = json{{"sequence", position.sequenceNumber()},
           {"processed", position.processed()}};
  if (position.receiver()) {
    j["receiver"] = position.receiver()->name;
    j["receiver_library"] = position.receiver()->library;
  }
}

void from_json(const json &j, JournalPosition &position) {
  uint64_t sequence = j.at("sequence").get<uint64_t>();
  bool processed = j.value("processed", false);
  if (j.contains("receiver") && !j["receiver"].is_null()) {
    position = JournalPosition(
        sequence,
        JournalReceiver{j.at("receiver").get<std::string>(),
                        j.at("receiver_library").get<std::string>()},
        processed);
  } else {
    position = JournalPosition(sequence, processed);
  }
}

PositionRange::PositionRange(JournalPosition rangeStart,
                             JournalPosition rangeEnd)
    : start(std::move(rangeStart)), end(std::move(rangeEnd)) {
  if (end < start) {
    throw std::invalid_argument("Range end " + end.toString() +
                                " precedes start " + start.toString());
  }
}
