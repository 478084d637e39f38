#include "journal/journal_entry_decoder.h"
#include "journal/journal_exceptions.h"
#include "journal/rjne0200_decoder.h"
#include "journal_test_buffers.h"
#include <cassert>
#include <iostream>

using TestBuffers::TestEntry;

namespace {

template <typename F> bool throwsDecodeError(F fn) {
  try {
    fn();
  } catch (const JournalDecodeException &) {
    return true;
  }
  return false;
}

const JournalReceiver RCV1{"RCV0001", "JRNLIB"};

} // namespace

void testFirstHeaderStatus() {
  std::cout << "Testing FirstHeaderDecoder - status mapping...\n";
  FirstHeaderDecoder decoder;

  FirstHeader none = decoder.decode(TestBuffers::firstHeader(64, 0, 0, '0'));
  assert(none.status == OffsetStatus::NO_MORE_DATA);
  assert(!none.nextPosition && !none.hasFutureDataAvailable());

  std::vector<uint8_t> withEntries =
      TestBuffers::block({TestEntry{5, RCV1}, TestEntry{6}});
  FirstHeader same = decoder.decode(withEntries);
  assert(same.status == OffsetStatus::MORE_DATA_SAME_OFFSET);
  assert(same.size == 2 && same.offset == 64);
  assert(same.totalBytes == withEntries.size());
  assert(!same.hasFutureDataAvailable());

  std::vector<uint8_t> continued = TestBuffers::block(
      {TestEntry{5, RCV1}}, '1', "RCV0002", "JRNLIB", 1234);
  FirstHeader next = decoder.decode(continued);
  assert(next.status == OffsetStatus::MORE_DATA_NEW_OFFSET);
  assert(next.hasFutureDataAvailable());
  assert(next.nextPosition &&
         *next.nextPosition ==
             JournalPosition(1234, JournalReceiver{"RCV0002", "JRNLIB"}));
  assert(!next.nextPosition->processed() &&
         "Continuation points at an entry not yet delivered");

  FirstHeader tooSmall = decoder.decode(
      TestBuffers::firstHeader(64, 0, 0, '1', "", "", 99));
  assert(tooSmall.status == OffsetStatus::MORE_DATA_NEW_OFFSET);
  assert(tooSmall.offset == 0);
  assert(tooSmall.nextPosition == JournalPosition(99));

  std::cout << "✓ status mapping test passed\n";
}

void testFirstHeaderRejectsMalformed() {
  std::cout << "Testing FirstHeaderDecoder - malformed buffers...\n";
  FirstHeaderDecoder decoder;

  std::vector<uint8_t> shortBuffer(63, 0);
  assert(throwsDecodeError([&] { decoder.decode(shortBuffer); }) &&
         "Buffer shorter than the header fails");

  std::vector<uint8_t> lying = TestBuffers::firstHeader(500, 0, 0, '0');
  assert(throwsDecodeError([&] { decoder.decode(lying); }) &&
         "Declared length beyond the buffer fails");

  std::vector<uint8_t> badHandle = TestBuffers::firstHeader(64, 0, 0, '7');
  assert(throwsDecodeError([&] { decoder.decode(badHandle); }));

  std::vector<uint8_t> badSequence =
      TestBuffers::firstHeader(64, 0, 0, '1', "RCV0001", "JRNLIB", 10);
  badSequence[40] = 0x7B;
  assert(throwsDecodeError([&] { decoder.decode(badSequence); }) &&
         "Non digit in a zoned field fails");

  std::cout << "✓ malformed buffer test passed\n";
}

void testEntryHeaderFields() {
  std::cout << "Testing EntryHeaderDecoder - fields...\n";
  EntryHeaderDecoder decoder;

  TestEntry first{41, RCV1, "R", "UP", "ORDERS", "SALES", {1, 2, 3}};
  std::vector<uint8_t> buffer = TestBuffers::block({first, TestEntry{42}});

  EntryHeader e = decoder.decode(buffer, 64);
  assert(e.sequenceNumber == 41);
  assert(e.nextEntryOffset > 0);
  assert(e.hasReceiver() && *e.receiver == RCV1);
  assert(e.code() == JournalCode::R && e.type() == JournalEntryType::UP);
  assert(e.objectName() == "ORDERS" && e.objectLibrary() == "SALES");
  assert(e.jobName == "QZDASOINIT" && e.userName == "QUSER");
  assert(e.jobNumber == "123456");
  assert(e.programName == "APPPGM" && e.programLibrary == "APPLIB");
  assert(e.userProfile == "APPUSER" && e.systemName == "S1234567");
  assert(e.countOrRrn == 410);

  EntryHeader second = decoder.decode(buffer, 64 + e.nextEntryOffset);
  assert(second.sequenceNumber == 42);
  assert(!second.hasReceiver());
  assert(second.nextEntryOffset == 0 && "Last entry has no successor");

  assert(e.toString().find("sequenceNumber=41") != std::string::npos);

  std::cout << "✓ entry fields test passed\n";
}

void testEntryHeaderTruncated() {
  std::cout << "Testing EntryHeaderDecoder - truncation...\n";
  EntryHeaderDecoder decoder;

  std::vector<uint8_t> buffer = TestBuffers::block({TestEntry{1, RCV1}});
  std::vector<uint8_t> headerOnly(buffer.begin(), buffer.begin() + 64 + 200);
  assert(throwsDecodeError([&] { decoder.decode(headerOnly, 64); }));

  std::vector<uint8_t> noReceiverInfo(buffer.begin(),
                                      buffer.begin() + 64 + 228 + 10);
  assert(throwsDecodeError([&] { decoder.decode(noReceiverInfo, 64); }) &&
         "Receiver info past the end fails");

  std::cout << "✓ truncation test passed\n";
}

void testRawEntryData() {
  std::cout << "Testing RawEntryDataDecoder...\n";
  EntryHeaderDecoder headerDecoder;
  RawEntryDataDecoder dataDecoder;

  std::vector<uint8_t> payload = {0xC1, 0xC2, 0xC3, 0x00, 0x01};
  std::vector<uint8_t> buffer =
      TestBuffers::block({TestEntry{3, RCV1, "R", "PT", "F", "L", payload}});
  EntryHeader e = headerDecoder.decode(buffer, 64);
  assert(dataDecoder.decode(e, buffer, 64) == payload);

  EntryHeader lying = e;
  lying.entrySpecificDataOffset = static_cast<uint32_t>(buffer.size());
  assert(throwsDecodeError([&] { dataDecoder.decode(lying, buffer, 64); }));

  std::cout << "✓ RawEntryDataDecoder test passed\n";
}

int main() {
  try {
    testFirstHeaderStatus();
    testFirstHeaderRejectsMalformed();
    testEntryHeaderFields();
    testEntryHeaderTruncated();
    testRawEntryData();
    std::cout << "\n✅ All RJNE0200 decoder tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
