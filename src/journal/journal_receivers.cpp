#include "journal/journal_receivers.h"
#include "core/logger.h"
#include "journal/journal_exceptions.h"
#include <algorithm>

JournalReceivers::JournalReceivers(IJournalInfoSource &infoSource,
                                   uint64_t maxServerSideEntries,
                                   JournalInfo journal)
    : infoSource_(infoSource), maxServerSideEntries_(maxServerSideEntries),
      journal_(std::move(journal)) {}

std::vector<DetailedJournalReceiver> JournalReceivers::usableReceivers() {
  std::vector<DetailedJournalReceiver> receivers =
      infoSource_.listReceivers(journal_);
  receivers.erase(std::remove_if(receivers.begin(), receivers.end(),
                                 [](const DetailedJournalReceiver &r) {
                                   return !r.isAvailable();
                                 }),
                  receivers.end());
  return receivers;
}

std::optional<PositionRange>
JournalReceivers::findRange(const JournalPosition &start) {
  std::vector<DetailedJournalReceiver> receivers = usableReceivers();
  if (receivers.empty()) {
    Logger::warning(LogCategory::JOURNAL, "JournalReceivers::findRange",
                    "No usable receivers for journal " +
                        journal_.qualifiedName());
    return std::nullopt;
  }

  const DetailedJournalReceiver &head = receivers.back();
  JournalPosition end(head.lastSequence, head.receiver);

  if (start.sequenceNumber() > end.sequenceNumber()) {
    Logger::debug(LogCategory::JOURNAL, "JournalReceivers::findRange",
                  "Start " + start.toString() + " is beyond live head " +
                      end.toString());
    return std::nullopt;
  }

  auto startIt = receivers.end();
  if (start.isReceiverQualified()) {
    startIt = std::find_if(receivers.begin(), receivers.end(),
                           [&](const DetailedJournalReceiver &r) {
                             return r.receiver == *start.receiver();
                           });
  } else {
    startIt = std::find_if(receivers.begin(), receivers.end(),
                           [&](const DetailedJournalReceiver &r) {
                             return r.contains(start.sequenceNumber());
                           });
  }

  if (startIt == receivers.end()) {
    Logger::debug(LogCategory::JOURNAL, "JournalReceivers::findRange",
                  "Unable to place " + start.toString() +
                      " in the receiver directory");
    return std::nullopt;
  }

  JournalPosition rangeStart(start.sequenceNumber(), startIt->receiver,
                             start.processed());

  if (end.sequenceNumber() - rangeStart.sequenceNumber() >
      maxServerSideEntries_) {
    uint64_t clipped = rangeStart.sequenceNumber() + maxServerSideEntries_;
    auto holder = std::find_if(startIt, receivers.end(),
                               [&](const DetailedJournalReceiver &r) {
                                 return r.lastSequence >= clipped;
                               });
    if (holder != receivers.end()) {
      end = JournalPosition(clipped, holder->receiver);
    }
  }

  return PositionRange(rangeStart, end);
}

JournalPosition JournalReceivers::currentPosition() {
  std::vector<DetailedJournalReceiver> receivers = usableReceivers();
  if (receivers.empty()) {
    throw RetrieveJournalException("No usable receivers for journal " +
                                   journal_.qualifiedName());
  }
  const DetailedJournalReceiver &head = receivers.back();
  return JournalPosition(head.lastSequence, head.receiver, true);
}
