#include "journal/journal_position.h"
#include "journal/rjne0200_decoder.h"
#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

EntryHeader entryAt(uint64_t sequence,
                    std::optional<JournalReceiver> receiver = std::nullopt) {
  EntryHeader e;
  e.sequenceNumber = sequence;
  e.receiver = std::move(receiver);
  return e;
}

const JournalReceiver RCV1{"RCV0001", "JRNLIB"};
const JournalReceiver RCV2{"RCV0002", "JRNLIB"};

} // namespace

void testAdvanceKeepsQualification() {
  std::cout << "Testing JournalPosition - advance...\n";

  JournalPosition position(10, RCV1, false);
  position.advance(entryAt(11));
  assert(position.sequenceNumber() == 11 && "Sequence should advance");
  assert(position.isReceiverQualified() && "Receiver should be kept");
  assert(*position.receiver() == RCV1);
  assert(position.processed() && "Advanced position is processed");

  position.advance(entryAt(12, RCV2));
  assert(*position.receiver() == RCV2 && "Receiver switches with the entry");

  JournalPosition plain(5);
  plain.advance(entryAt(6));
  assert(!plain.isReceiverQualified() && "Plain position stays plain");
  plain.advance(entryAt(7, RCV1));
  assert(plain.isReceiverQualified() && "Entry receiver qualifies position");

  std::cout << "✓ advance test passed\n";
}

void testEqualityIgnoresProcessed() {
  std::cout << "Testing JournalPosition - equality...\n";

  assert(JournalPosition(5, RCV1, true) == JournalPosition(5, RCV1, false));
  assert(JournalPosition(5, RCV1) != JournalPosition(5, RCV2));
  assert(JournalPosition(5, RCV1) != JournalPosition(5) &&
         "Qualification takes part in equality");
  assert(JournalPosition(4) < JournalPosition(5));
  assert(JournalPosition(5) <= JournalPosition(5, RCV1));

  std::cout << "✓ equality test passed\n";
}

void testIsAlreadyProcessed() {
  std::cout << "Testing isAlreadyProcessed...\n";

  JournalPosition processed(20, RCV1, true);
  assert(isAlreadyProcessed(processed, entryAt(20)) &&
         "Same sequence without receiver is a duplicate");
  assert(isAlreadyProcessed(processed, entryAt(20, RCV1)));
  assert(!isAlreadyProcessed(processed, entryAt(21)) &&
         "Next sequence is new");
  assert(!isAlreadyProcessed(processed, entryAt(20, RCV2)) &&
         "Different receiver is new");

  JournalPosition pending(20, RCV1, false);
  assert(!isAlreadyProcessed(pending, entryAt(20)) &&
         "Unprocessed position never suppresses an entry");

  assert(processed.sequenceNumber() == 20 && processed.processed() &&
         "Prior position is not modified");

  JournalPosition plain(20, true);
  assert(isAlreadyProcessed(plain, entryAt(20, RCV1)) &&
         "Plain cursor matches any receiver at its sequence");
  assert(isAlreadyProcessed(plain, entryAt(20)));
  assert(!isAlreadyProcessed(plain, entryAt(21, RCV1)));
  assert(!isAlreadyProcessed(JournalPosition(20), entryAt(20, RCV1)) &&
         "Plain unprocessed cursor never suppresses an entry");

  std::cout << "✓ isAlreadyProcessed test passed\n";
}

void testSetPositionAndSetOffset() {
  std::cout << "Testing JournalPosition - setters...\n";

  JournalPosition position(1, RCV1, true);
  position.setOffset(40, false);
  assert(position.sequenceNumber() == 40 && !position.processed());
  assert(*position.receiver() == RCV1 && "setOffset keeps the receiver");

  position.setPosition(JournalPosition(50));
  assert(!position.isReceiverQualified() && "setPosition replaces everything");
  assert(position.offset() == 50);

  std::cout << "✓ setters test passed\n";
}

void testJsonPersistence() {
  std::cout << "Testing JournalPosition - JSON...\n";

  json stored = JournalPosition(123456789012ULL, RCV2, true);
  assert(stored["sequence"].get<uint64_t>() == 123456789012ULL);
  assert(stored["receiver"] == "RCV0002");
  assert(stored["receiver_library"] == "JRNLIB");
  assert(stored["processed"] == true);

  JournalPosition restored = stored.get<JournalPosition>();
  assert(restored == JournalPosition(123456789012ULL, RCV2));
  assert(restored.processed());

  json plain = json::parse(R"({"sequence": 77})");
  JournalPosition plainPosition = plain.get<JournalPosition>();
  assert(!plainPosition.isReceiverQualified());
  assert(!plainPosition.processed() && "processed defaults to false");

  std::cout << "✓ JSON test passed\n";
}

void testPositionRange() {
  std::cout << "Testing PositionRange...\n";

  PositionRange empty(JournalPosition(9, RCV1), JournalPosition(9, RCV1, true));
  assert(empty.isEmpty() && "start == end is an empty range");

  PositionRange open(JournalPosition(9, RCV1), JournalPosition(12, RCV2));
  assert(!open.isEmpty());

  bool threw = false;
  try {
    PositionRange invalid(JournalPosition(12), JournalPosition(9));
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw && "end before start must be rejected");

  std::cout << "✓ PositionRange test passed\n";
}

int main() {
  try {
    testAdvanceKeepsQualification();
    testEqualityIgnoresProcessed();
    testIsAlreadyProcessed();
    testSetPositionAndSetOffset();
    testJsonPersistence();
    testPositionRange();
    std::cout << "\n✅ All JournalPosition tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
