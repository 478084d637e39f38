#ifndef JOURNAL_RETRIEVAL_SERVICE_H
#define JOURNAL_RETRIEVAL_SERVICE_H

#include "journal/journal_position.h"
#include "journal/retrieval_criteria.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Diagnostic returned by the retrieval service. id is the IBM i message
// identifier (e.g. CPF7053) and may be missing when the diagnostic could not
// be parsed.
struct JournalMessage {
  std::optional<std::string> id;
  std::string text;
  std::string help;

  std::string toString() const {
    return (id ? *id : std::string("<no id>")) + ": " + text;
  }
};

struct RetrievalRequest {
  JournalInfo journal;
  std::string formatName{"RJNE0200"};
  size_t bufferSize{0};
  // Variable length selection records, already EBCDIC encoded.
  std::vector<uint8_t> selection;
  // Readable rendering of the selection, for logs and exception messages.
  std::string description;
};

struct RetrievalResponse {
  bool success{false};
  std::vector<uint8_t> data;
  std::vector<JournalMessage> messages;
};

class IJournalRetrievalService {
public:
  virtual ~IJournalRetrievalService() = default;

  virtual RetrievalResponse retrieveEntries(const RetrievalRequest &request) = 0;
};

struct DetailedJournalReceiver {
  JournalReceiver receiver;
  uint64_t firstSequence{0};
  uint64_t lastSequence{0};
  // ONLINE, ATTACHED, SAVED, FREED, PARTIAL, ...
  std::string status;
  std::string attachTimestamp;

  bool isAttached() const { return status == "ATTACHED"; }
  bool isAvailable() const {
    return status == "ATTACHED" || status == "ONLINE" || status == "SAVED";
  }
  bool contains(uint64_t sequence) const {
    return sequence >= firstSequence && sequence <= lastSequence;
  }
};

class IJournalInfoSource {
public:
  virtual ~IJournalInfoSource() = default;

  // Receivers of the journal in attach order.
  virtual std::vector<DetailedJournalReceiver>
  listReceivers(const JournalInfo &journal) = 0;
};

#endif
