#ifndef PARAMETER_LIST_BUILDER_H
#define PARAMETER_LIST_BUILDER_H

#include "journal/journal_position.h"
#include "journal/journal_retrieval_service.h"
#include "journal/retrieval_criteria.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Builds the "journal entries to retrieve" selection for
// QjoRetrieveJournalEntries. The journal identity survives init(); every
// other criterion is per call.
class ParameterListBuilder {
public:
  static constexpr int32_t KEY_RECEIVER_RANGE = 1;
  static constexpr int32_t KEY_STARTING_SEQUENCE = 2;
  static constexpr int32_t KEY_ENDING_SEQUENCE = 4;
  static constexpr int32_t KEY_ENTRY_TYPES = 8;
  static constexpr int32_t KEY_FILES = 16;

  static constexpr size_t NAME_LENGTH = 10;
  static constexpr size_t RECEIVER_RANGE_LENGTH = 40;
  static constexpr size_t SEQUENCE_LENGTH = 20;

  ParameterListBuilder &withJournal(const std::string &journalName,
                                    const std::string &journalLibrary);
  void init();

  ParameterListBuilder &withJournalEntryType(JournalEntryType type);
  ParameterListBuilder &withFileFilters(const std::vector<FileFilter> &files);
  ParameterListBuilder &withStartingSequence(uint64_t sequence);
  ParameterListBuilder &withReceivers(const std::string &startReceiver,
                                      const std::string &startLibrary,
                                      const std::string &endReceiver,
                                      const std::string &endLibrary);
  ParameterListBuilder &withEnd(uint64_t sequence);
  // Open ended request from position to whatever the journal holds now.
  ParameterListBuilder &fromPositionToEnd(const JournalPosition &position);

  std::vector<uint8_t> buildSelection() const;
  RetrievalRequest build(size_t bufferSize) const;

  const JournalInfo &journal() const { return journal_; }
  std::string toString() const;

private:
  JournalInfo journal_;
  std::optional<std::string> receiverRange_;
  std::optional<uint64_t> startingSequence_;
  std::optional<uint64_t> endingSequence_;
  std::optional<JournalEntryType> entryType_;
  std::vector<FileFilter> files_;
};

#endif
