#ifndef JOURNAL_RETRIEVER_H
#define JOURNAL_RETRIEVER_H

#include "core/logger.h"
#include "journal/entry_dump_writer.h"
#include "journal/journal_entry_decoder.h"
#include "journal/journal_exceptions.h"
#include "journal/journal_position.h"
#include "journal/journal_receivers.h"
#include "journal/journal_retrieval_service.h"
#include "journal/parameter_list_builder.h"
#include "journal/rjne0200_decoder.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct RetrieveConfig {
  JournalInfo journal;
  size_t bufferSize{65536};
  uint64_t maxServerSideEntries{1000};
  bool filtering{false};
  std::vector<FileFilter> includeFiles;
  std::string dumpFolder;
};

enum class RetrievalState {
  IDLE,
  RANGE_RESOLVED,
  CALL_DISPATCHED,
  DECODED,
  NO_DATA,
  FATAL_ERROR
};

std::string toString(RetrievalState state);

// Scratch state of one retrieve call: the buffer returned by the service,
// its block header, the entry currently under the cursor and the cursor
// itself. Only JournalRetriever moves it forward.
class RetrievalSession {
public:
  explicit RetrievalSession(JournalPosition position);
  // Replays an already fetched buffer.
  RetrievalSession(std::vector<uint8_t> data, FirstHeader header,
                   JournalPosition position);

  const JournalPosition &position() const { return position_; }
  const FirstHeader &header() const { return header_; }
  const std::optional<EntryHeader> &entryHeader() const {
    return entryHeader_;
  }
  int64_t offset() const { return offset_; }
  const std::vector<uint8_t> &data() const { return data_; }
  RetrievalState state() const { return state_; }

private:
  friend class JournalRetriever;

  std::vector<uint8_t> data_;
  FirstHeader header_;
  std::optional<EntryHeader> entryHeader_;
  int64_t offset_{-1};
  JournalPosition position_;
  RetrievalState state_{RetrievalState::IDLE};
};

struct FoldedHead {
  FirstHeader header;
  JournalPosition position;
};

// Records liveHead as the header's current journal position and moves the
// cursor onto it.
FoldedHead foldLiveHead(const FirstHeader &header,
                        const JournalPosition &liveHead);

class JournalRetriever {
public:
  JournalRetriever(RetrieveConfig config, IJournalRetrievalService &service,
                   IJournalInfoSource &infoSource);

  // Fetches one block starting at position. Returns normally for fresh data,
  // no new data, data filtered away and a buffer too small for one entry;
  // throws a JournalException subclass otherwise.
  RetrievalSession retrieve(const JournalPosition &position);

  bool hasData(const RetrievalSession &session) const;
  bool nextEntry(RetrievalSession &session) const;

  template <typename T>
  T decode(const RetrievalSession &session,
           const IJournalEntryDecoder<T> &decoder) const;

  bool futureDataAvailable(const RetrievalSession &session) const {
    return session.header_.hasFutureDataAvailable();
  }
  std::string headerAsString(const RetrievalSession &session) const;

  uint64_t totalTransferred() const { return totalTransferred_; }
  RetrievalState lastState() const { return lastState_; }
  const RetrieveConfig &config() const { return config_; }
  JournalReceivers &receivers() { return receivers_; }

private:
  void handleFailure(RetrievalSession &session,
                     const RetrievalResponse &response,
                     const std::optional<JournalPosition> &latest);
  void applyLiveHead(RetrievalSession &session,
                     const JournalPosition &liveHead) const;
  void updateOffsetFromContinuation(RetrievalSession &session) const;
  void dumpFailedEntry(const RetrievalSession &session,
                       const std::string &reason) const;

  RetrieveConfig config_;
  IJournalRetrievalService &service_;
  JournalReceivers receivers_;
  ParameterListBuilder builder_;
  FirstHeaderDecoder firstHeaderDecoder_;
  EntryHeaderDecoder entryHeaderDecoder_;
  EntryDumpWriter dumpWriter_;
  uint64_t totalTransferred_{0};
  RetrievalState lastState_{RetrievalState::IDLE};
};

template <typename T>
T JournalRetriever::decode(const RetrievalSession &session,
                           const IJournalEntryDecoder<T> &decoder) const {
  if (!session.entryHeader_ || session.offset_ < 0) {
    throw JournalDecodeException("No current entry to decode");
  }
  try {
    return decoder.decode(*session.entryHeader_, session.data_,
                          static_cast<size_t>(session.offset_));
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DECODE, "JournalRetriever::decode",
                  "Failed to decode entry at " + session.position_.toString() +
                      ": " + e.what());
    dumpFailedEntry(session, e.what());
    throw;
  }
}

#endif
