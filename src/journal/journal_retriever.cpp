#include "journal/journal_retriever.h"
#include "journal/message_classifier.h"

namespace {

std::string fullText(const JournalMessage &message) {
  if (message.help.empty())
    return message.text;
  return message.text + " " + message.help;
}

std::string optToString(const std::optional<JournalPosition> &position) {
  return position ? position->toString() : "<null>";
}

} // namespace

std::string toString(RetrievalState state) {
  switch (state) {
  case RetrievalState::IDLE:
    return "IDLE";
  case RetrievalState::RANGE_RESOLVED:
    return "RANGE_RESOLVED";
  case RetrievalState::CALL_DISPATCHED:
    return "CALL_DISPATCHED";
  case RetrievalState::DECODED:
    return "DECODED";
  case RetrievalState::NO_DATA:
    return "NO_DATA";
  case RetrievalState::FATAL_ERROR:
    return "FATAL_ERROR";
  default:
    return "UNKNOWN";
  }
}

RetrievalSession::RetrievalSession(JournalPosition position)
    : position_(std::move(position)) {}

RetrievalSession::RetrievalSession(std::vector<uint8_t> data,
                                   FirstHeader header,
                                   JournalPosition position)
    : data_(std::move(data)), header_(std::move(header)),
      position_(std::move(position)), state_(RetrievalState::DECODED) {}

FoldedHead foldLiveHead(const FirstHeader &header,
                        const JournalPosition &liveHead) {
  return FoldedHead{header.withCurrentJournalPosition(liveHead), liveHead};
}

JournalRetriever::JournalRetriever(RetrieveConfig config,
                                   IJournalRetrievalService &service,
                                   IJournalInfoSource &infoSource)
    : config_(std::move(config)), service_(service),
      receivers_(infoSource, config_.maxServerSideEntries, config_.journal),
      dumpWriter_(config_.dumpFolder) {
  builder_.withJournal(config_.journal.journalName,
                       config_.journal.journalLibrary);
}

RetrievalSession JournalRetriever::retrieve(const JournalPosition &position) {
  RetrievalSession session(position);
  lastState_ = RetrievalState::IDLE;

  Logger::debug(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                "Fetch journal at position " + position.toString());

  builder_.init();
  builder_.withJournalEntryType(JournalEntryType::ALL);
  if (config_.filtering && !config_.includeFiles.empty()) {
    builder_.withFileFilters(config_.includeFiles);
  }

  std::optional<PositionRange> range = receivers_.findRange(position);
  session.state_ = RetrievalState::RANGE_RESOLVED;
  lastState_ = session.state_;

  if (range) {
    if (range->isEmpty()) {
      Logger::debug(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                    "Already at live head " + range->end.toString());
      session.header_ =
          FirstHeader(0, 0, 0, OffsetStatus::NO_MORE_DATA, range->end);
      session.state_ = RetrievalState::NO_DATA;
      lastState_ = session.state_;
      return session;
    }
    // An explicit receiver chain keeps *CURCHAIN from looping the service
    // over the same receivers.
    session.position_ = range->start;
    builder_.withStartingSequence(range->start.sequenceNumber());
    builder_.withReceivers(range->start.receiver()->name,
                           range->start.receiver()->library,
                           range->end.receiver()->name,
                           range->end.receiver()->library);
    builder_.withEnd(range->end.sequenceNumber());
  } else {
    builder_.fromPositionToEnd(position);
  }

  std::optional<JournalPosition> latest;
  if (range) {
    latest = range->end;
  }

  RetrievalResponse response =
      service_.retrieveEntries(builder_.build(config_.bufferSize));
  session.state_ = RetrievalState::CALL_DISPATCHED;
  lastState_ = session.state_;

  if (!response.success) {
    handleFailure(session, response, latest);
    return session;
  }

  session.data_ = std::move(response.data);
  try {
    session.header_ = firstHeaderDecoder_.decode(session.data_);
  } catch (const JournalDecodeException &e) {
    session.state_ = RetrievalState::FATAL_ERROR;
    lastState_ = session.state_;
    Logger::error(LogCategory::DECODE, "JournalRetriever::retrieve",
                  "Invalid first header at " + position.toString() + ": " +
                      e.what());
    throw;
  }
  totalTransferred_ += session.header_.totalBytes;
  Logger::debug(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                "first header: " + session.header_.toString());

  if (session.header_.status == OffsetStatus::MORE_DATA_NEW_OFFSET &&
      session.header_.offset == 0) {
    Logger::error(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                  "Buffer of " + std::to_string(config_.bufferSize) +
                      " bytes too small, skipping entry at " +
                      position.toString());
    if (session.header_.nextPosition) {
      session.position_.setPosition(*session.header_.nextPosition);
    }
    session.state_ = RetrievalState::NO_DATA;
    lastState_ = session.state_;
    return session;
  }

  if (!hasData(session)) {
    if (latest) {
      Logger::debug(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                    "Moving on to current position " + latest->toString());
      applyLiveHead(session, *latest);
    }
    session.state_ = RetrievalState::NO_DATA;
  } else {
    session.state_ = RetrievalState::DECODED;
  }
  lastState_ = session.state_;
  return session;
}

void JournalRetriever::handleFailure(
    RetrievalSession &session, const RetrievalResponse &response,
    const std::optional<JournalPosition> &latest) {
  const std::string context = "Call failed position " +
                              session.position_.toString() + " parameters " +
                              builder_.toString();

  for (const auto &message : response.messages) {
    switch (classifyMessage(message.id)) {
    case MessageClassification::MISSING_IDENTIFIER:
      Logger::error(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                    context + " no id, message: " + message.text);
      break;
    case MessageClassification::INVALID_POSITION:
      session.state_ = RetrievalState::FATAL_ERROR;
      lastState_ = session.state_;
      throw InvalidPositionException(context + " failed to find sequence, "
                                               "receiver or offset range (" +
                                     *message.id + "): " + fullText(message));
    case MessageClassification::INVALID_FILTER:
      session.state_ = RetrievalState::FATAL_ERROR;
      lastState_ = session.state_;
      throw InvalidJournalFilterException(
          context + " object not found or not journaled (" + *message.id +
          "): " + fullText(message));
    case MessageClassification::NO_DATA_AFTER_FILTERING:
      Logger::debug(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                    context + " no data received, probably all filtered: " +
                        message.text);
      session.header_ =
          FirstHeader(0, 0, 0, OffsetStatus::NO_MORE_DATA, latest);
      if (latest) {
        applyLiveHead(session, *latest);
      }
      session.state_ = RetrievalState::NO_DATA;
      lastState_ = session.state_;
      return;
    case MessageClassification::UNCLASSIFIED:
    default:
      Logger::error(LogCategory::JOURNAL, "JournalRetriever::retrieve",
                    context + " with error code " + *message.id +
                        " message " + fullText(message));
      break;
    }
  }

  session.state_ = RetrievalState::FATAL_ERROR;
  lastState_ = session.state_;
  std::string detail;
  for (const auto &message : response.messages) {
    detail += " [" + message.toString() + "]";
  }
  throw RetrieveJournalException(context + " latest " + optToString(latest) +
                                 detail);
}

void JournalRetriever::applyLiveHead(RetrievalSession &session,
                                     const JournalPosition &liveHead) const {
  FoldedHead folded = foldLiveHead(session.header_, liveHead);
  session.header_ = std::move(folded.header);
  session.position_.setPosition(folded.position);
}

bool JournalRetriever::hasData(const RetrievalSession &session) const {
  if (session.state_ == RetrievalState::NO_DATA ||
      session.state_ == RetrievalState::FATAL_ERROR) {
    return false;
  }
  if (session.header_.status == OffsetStatus::NO_MORE_DATA) {
    return false;
  }
  if (session.offset_ < 0 && session.header_.size > 0) {
    return true;
  }
  if (session.offset_ >= 0 && session.entryHeader_ &&
      session.entryHeader_->nextEntryOffset > 0) {
    return true;
  }
  return false;
}

bool JournalRetriever::nextEntry(RetrievalSession &session) const {
  if (session.state_ == RetrievalState::NO_DATA ||
      session.state_ == RetrievalState::FATAL_ERROR) {
    return false;
  }

  if (session.offset_ < 0) {
    if (session.header_.size == 0) {
      return false;
    }
    session.offset_ = session.header_.offset;
    session.entryHeader_ = entryHeaderDecoder_.decode(
        session.data_, static_cast<size_t>(session.offset_));
    if (isAlreadyProcessed(session.position_, *session.entryHeader_)) {
      Logger::debug(LogCategory::JOURNAL, "JournalRetriever::nextEntry",
                    "Skipping already processed entry " +
                        std::to_string(session.entryHeader_->sequenceNumber));
      session.position_.advance(*session.entryHeader_);
      return nextEntry(session);
    }
    session.position_.advance(*session.entryHeader_);
    return true;
  }

  uint32_t nextOffset =
      session.entryHeader_ ? session.entryHeader_->nextEntryOffset : 0;
  if (nextOffset > 0) {
    session.offset_ += nextOffset;
    session.entryHeader_ = entryHeaderDecoder_.decode(
        session.data_, static_cast<size_t>(session.offset_));
    session.position_.advance(*session.entryHeader_);
    return true;
  }

  updateOffsetFromContinuation(session);
  return false;
}

void JournalRetriever::updateOffsetFromContinuation(
    RetrievalSession &session) const {
  if (session.header_.nextPosition) {
    Logger::debug(LogCategory::JOURNAL, "JournalRetriever::nextEntry",
                  "Setting continuation offset " +
                      session.header_.nextPosition->toString());
    session.position_.setPosition(*session.header_.nextPosition);
  }
}

std::string
JournalRetriever::headerAsString(const RetrievalSession &session) const {
  if (session.state_ == RetrievalState::IDLE) {
    return "null header\n";
  }
  return session.header_.toString();
}

void JournalRetriever::dumpFailedEntry(const RetrievalSession &session,
                                       const std::string &reason) const {
  if (!dumpWriter_.isEnabled()) {
    return;
  }
  std::string text = session.entryHeader_ ? session.entryHeader_->toString()
                                          : std::string("no entry header");
  text += "\nreason: " + reason;
  dumpWriter_.dump(session.data_, static_cast<size_t>(session.offset_), text);
}
