#include "journal/journal_poller.h"
#include "journal_test_buffers.h"
#include "mock_journal_services.h"
#include <cassert>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using TestBuffers::TestEntry;

namespace {

const JournalInfo JOURNAL{"QSQJRN", "SALES"};
const JournalReceiver RCV1{"RCV0001", "JRNLIB"};
const std::string KEY = "journal:SALES/QSQJRN";

struct Fixture {
  MockJournalInfoSource infoSource;
  MockRetrievalService service;
  InMemoryOffsetStore store;
  RetrieveConfig config;

  Fixture() {
    infoSource.receivers = {TestBuffers::receiver("RCV0001", 1, 10,
                                                  "ATTACHED")};
    config.journal = JOURNAL;
  }
};

std::vector<TestEntry> entries(uint64_t from, uint64_t to) {
  std::vector<TestEntry> result;
  for (uint64_t s = from; s <= to; ++s) {
    TestEntry e;
    e.sequence = s;
    if (s == from)
      e.receiver = RCV1;
    result.push_back(e);
  }
  return result;
}

} // namespace

void testStartsAtLiveHead() {
  std::cout << "Testing JournalPoller - no stored offset...\n";
  Fixture f;
  JournalRetriever retriever(f.config, f.service, f.infoSource);
  JournalPoller poller(retriever, f.store, KEY, std::chrono::milliseconds(10));

  JournalPosition start = poller.initialPosition();
  assert(start == JournalPosition(10, RCV1) && start.processed());

  size_t surfaced = poller.pollOnce([](JournalRetriever &,
                                       const RetrievalSession &) {
    return true;
  });
  assert(surfaced == 0);
  assert(f.service.requests.empty() && "Nothing new past the live head");
  assert(f.store.saves == 0 && "Unchanged cursor is not persisted");

  std::cout << "✓ live head start test passed\n";
}

void testPersistsAfterDrain() {
  std::cout << "Testing JournalPoller - persist after drain...\n";
  Fixture f;
  f.store.offsets[KEY] = JournalPosition(5, RCV1, true);
  f.service.queueData(TestBuffers::block(entries(5, 10)));
  JournalRetriever retriever(f.config, f.service, f.infoSource);
  JournalPoller poller(retriever, f.store, KEY, std::chrono::milliseconds(10));

  std::vector<uint64_t> seen;
  size_t surfaced = poller.pollOnce(
      [&](JournalRetriever &, const RetrievalSession &session) {
        seen.push_back(session.entryHeader()->sequenceNumber);
        return true;
      });
  assert(surfaced == 5);
  assert((seen == std::vector<uint64_t>{6, 7, 8, 9, 10}));
  assert(f.store.saves == 1);
  assert(f.store.offsets[KEY] == JournalPosition(10, RCV1));
  assert(f.store.offsets[KEY].processed());
  assert(!poller.lastFutureDataAvailable());

  std::cout << "✓ persist after drain test passed\n";
}

void testHandlerEndsCycle() {
  std::cout << "Testing JournalPoller - handler stops the cycle...\n";
  Fixture f;
  f.store.offsets[KEY] = JournalPosition(4, RCV1, true);
  f.service.queueData(TestBuffers::block(entries(5, 10)));
  f.service.queueData(TestBuffers::block(entries(6, 10)));
  JournalRetriever retriever(f.config, f.service, f.infoSource);
  JournalPoller poller(retriever, f.store, KEY, std::chrono::milliseconds(10));

  size_t surfaced = poller.pollOnce(
      [](JournalRetriever &, const RetrievalSession &) { return false; });
  assert(surfaced == 1);
  assert(poller.position() == JournalPosition(5, RCV1) &&
         poller.position().processed());
  assert(f.store.offsets[KEY] == JournalPosition(5, RCV1));

  std::vector<uint64_t> seen;
  poller.pollOnce([&](JournalRetriever &, const RetrievalSession &session) {
    seen.push_back(session.entryHeader()->sequenceNumber);
    return true;
  });
  assert(seen.front() == 6 && "Next cycle resumes after the handled entry");
  assert(f.service.requests[1].description.find("start=5") !=
         std::string::npos);

  std::cout << "✓ handler stops the cycle test passed\n";
}

void testHandlerFailureKeepsProgress() {
  std::cout << "Testing JournalPoller - handler failure...\n";
  Fixture f;
  f.store.offsets[KEY] = JournalPosition(4, RCV1, true);
  f.service.queueData(TestBuffers::block(entries(5, 10)));
  JournalRetriever retriever(f.config, f.service, f.infoSource);
  JournalPoller poller(retriever, f.store, KEY, std::chrono::milliseconds(10));

  size_t handled = 0;
  bool threw = false;
  try {
    poller.pollOnce([&](JournalRetriever &, const RetrievalSession &session) {
      if (session.entryHeader()->sequenceNumber == 8)
        throw std::runtime_error("bad payload");
      ++handled;
      return true;
    });
  } catch (const std::runtime_error &e) {
    threw = std::string(e.what()) == "bad payload";
  }
  assert(threw && "Handler failure reaches the caller");
  assert(handled == 3);
  assert(f.store.saves == 1 && "Progress before the failure is persisted");
  assert(f.store.offsets[KEY] == JournalPosition(7, RCV1));
  assert(f.store.offsets[KEY].processed());
  assert(poller.position() == JournalPosition(7, RCV1));

  std::cout << "✓ handler failure test passed\n";
}

void testStopDuringWait() {
  std::cout << "Testing JournalPoller - stop while waiting...\n";
  Fixture f;
  JournalRetriever retriever(f.config, f.service, f.infoSource);
  JournalPoller poller(retriever, f.store, KEY, std::chrono::seconds(30));

  std::exception_ptr failure;
  bool interrupted = false;
  std::thread worker([&] {
    try {
      poller.run([](JournalRetriever &, const RetrievalSession &) {
        return true;
      });
    } catch (const RetrievalInterruptedException &) {
      interrupted = true;
    } catch (...) {
      failure = std::current_exception();
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  poller.stop();
  worker.join();

  if (failure)
    std::rethrow_exception(failure);
  assert(interrupted && "Waiting poller reports the interruption");
  assert(poller.isStopRequested());

  std::cout << "✓ stop while waiting test passed\n";
}

void testEmptyDirectoryFails() {
  std::cout << "Testing JournalPoller - empty receiver directory...\n";
  Fixture f;
  f.infoSource.receivers.clear();
  JournalRetriever retriever(f.config, f.service, f.infoSource);
  JournalPoller poller(retriever, f.store, KEY, std::chrono::milliseconds(10));

  bool threw = false;
  try {
    poller.initialPosition();
  } catch (const RetrieveJournalException &) {
    threw = true;
  }
  assert(threw);

  std::cout << "✓ empty receiver directory test passed\n";
}

int main() {
  try {
    testStartsAtLiveHead();
    testPersistsAfterDrain();
    testHandlerEndsCycle();
    testHandlerFailureKeepsProgress();
    testStopDuringWait();
    testEmptyDirectoryFails();
    std::cout << "\n✅ All JournalPoller tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
