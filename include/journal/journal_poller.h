#ifndef JOURNAL_POLLER_H
#define JOURNAL_POLLER_H

#include "journal/journal_retriever.h"
#include "storage/offset_store.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

// Called for every surfaced entry. Returning false ends the current cycle
// after the entry; the cursor reached so far is still persisted. When it
// throws, the cursor after the last returning call is persisted and the
// exception propagates.
using EntryHandler =
    std::function<bool(JournalRetriever &, const RetrievalSession &)>;

class JournalPoller {
public:
  JournalPoller(JournalRetriever &retriever, IOffsetStore &offsetStore,
                std::string offsetKey, std::chrono::milliseconds pollInterval);

  // Persisted cursor, or the live head when nothing was stored yet.
  JournalPosition initialPosition();

  // One retrieve, drain and persist cycle from the current cursor.
  size_t pollOnce(const EntryHandler &handler);

  // Polls until stop(). Throws RetrievalInterruptedException when stopped
  // while waiting for the next poll.
  void run(const EntryHandler &handler);
  void stop();
  bool isStopRequested() const { return stopRequested_.load(); }

  const JournalPosition &position() const { return position_; }
  void setPosition(const JournalPosition &position) { position_ = position; }
  bool lastFutureDataAvailable() const { return lastFutureDataAvailable_; }

private:
  void waitForNextPoll();

  JournalRetriever &retriever_;
  IOffsetStore &offsetStore_;
  std::string offsetKey_;
  std::chrono::milliseconds pollInterval_;
  JournalPosition position_;
  bool positionLoaded_{false};
  bool lastFutureDataAvailable_{false};

  std::atomic<bool> stopRequested_{false};
  std::mutex waitMutex_;
  std::condition_variable waitCv_;
};

#endif
