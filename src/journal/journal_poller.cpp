#include "journal/journal_poller.h"
#include "core/logger.h"
#include <exception>

JournalPoller::JournalPoller(JournalRetriever &retriever,
                             IOffsetStore &offsetStore, std::string offsetKey,
                             std::chrono::milliseconds pollInterval)
    : retriever_(retriever), offsetStore_(offsetStore),
      offsetKey_(std::move(offsetKey)), pollInterval_(pollInterval) {}

JournalPosition JournalPoller::initialPosition() {
  std::optional<JournalPosition> stored = offsetStore_.load(offsetKey_);
  if (stored) {
    Logger::info(LogCategory::OFFSETS, "JournalPoller::initialPosition",
                 "Resuming from " + stored->toString());
    return *stored;
  }
  JournalPosition head = retriever_.receivers().currentPosition();
  Logger::info(LogCategory::OFFSETS, "JournalPoller::initialPosition",
               "No stored offset, starting from live head " +
                   head.toString());
  return head;
}

size_t JournalPoller::pollOnce(const EntryHandler &handler) {
  if (!positionLoaded_) {
    position_ = initialPosition();
    positionLoaded_ = true;
  }

  const JournalPosition before = position_;
  RetrievalSession session = retriever_.retrieve(position_);

  size_t surfaced = 0;
  JournalPosition handled = before;
  while (!stopRequested_.load() && retriever_.nextEntry(session)) {
    ++surfaced;
    bool keepGoing;
    try {
      keepGoing = handler(retriever_, session);
    } catch (const std::exception &e) {
      position_ = handled;
      if (position_ != before || position_.processed() != before.processed()) {
        offsetStore_.save(offsetKey_, position_);
      }
      Logger::error(LogCategory::JOURNAL, "JournalPoller::pollOnce",
                    "Handler failed at sequence " +
                        std::to_string(session.entryHeader()->sequenceNumber) +
                        ", cursor kept at " + position_.toString() + ": " +
                        e.what());
      throw;
    }
    handled = session.position();
    if (!keepGoing) {
      Logger::debug(LogCategory::JOURNAL, "JournalPoller::pollOnce",
                    "Handler ended the cycle at " + handled.toString());
      break;
    }
  }

  position_ = session.position();
  lastFutureDataAvailable_ = retriever_.futureDataAvailable(session);

  if (position_ != before || position_.processed() != before.processed()) {
    offsetStore_.save(offsetKey_, position_);
  }

  if (surfaced > 0) {
    Logger::info(LogCategory::JOURNAL, "JournalPoller::pollOnce",
                 std::to_string(surfaced) + " entries up to " +
                     position_.toString() + ", " +
                     std::to_string(retriever_.totalTransferred()) +
                     " bytes transferred in total");
  }
  return surfaced;
}

void JournalPoller::run(const EntryHandler &handler) {
  Logger::info(LogCategory::JOURNAL, "JournalPoller::run",
               "Polling " + retriever_.config().journal.qualifiedName() +
                   " every " + std::to_string(pollInterval_.count()) + "ms");

  while (!stopRequested_.load()) {
    pollOnce(handler);
    if (!lastFutureDataAvailable_) {
      waitForNextPoll();
    }
  }

  Logger::info(LogCategory::JOURNAL, "JournalPoller::run",
               "Stopped at " + position_.toString());
}

void JournalPoller::stop() {
  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    stopRequested_.store(true);
  }
  waitCv_.notify_all();
}

void JournalPoller::waitForNextPoll() {
  std::unique_lock<std::mutex> lock(waitMutex_);
  if (waitCv_.wait_for(lock, pollInterval_,
                       [this] { return stopRequested_.load(); })) {
    throw RetrievalInterruptedException(
        "Interrupted while waiting to poll " +
        retriever_.config().journal.qualifiedName() + " at " +
        position_.toString());
  }
}
