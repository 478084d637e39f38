#ifndef JOURNAL_RECEIVERS_H
#define JOURNAL_RECEIVERS_H

#include "journal/journal_position.h"
#include "journal/journal_retrieval_service.h"
#include "journal/retrieval_criteria.h"
#include <cstdint>
#include <optional>
#include <vector>

// Resolves the receiver chain a retrieval call should scan.
class JournalReceivers {
public:
  JournalReceivers(IJournalInfoSource &infoSource,
                   uint64_t maxServerSideEntries, JournalInfo journal);

  // An empty optional means the start could not be placed in the receiver
  // directory and the caller should send an open ended request instead.
  // Otherwise start is qualified with its receiver and keeps the processed
  // flag of the requested position, and end is the live head clipped to
  // maxServerSideEntries past start.
  std::optional<PositionRange> findRange(const JournalPosition &start);

  // Live head of the journal, marked processed.
  JournalPosition currentPosition();

private:
  std::vector<DetailedJournalReceiver> usableReceivers();

  IJournalInfoSource &infoSource_;
  uint64_t maxServerSideEntries_;
  JournalInfo journal_;
};

#endif
