#include "engines/as400_engine.h"
#include "journal/message_classifier.h"
#include "utils/ebcdic.h"
#include <algorithm>
#include <cassert>
#include <functional>
#include <iostream>
#include <string>

namespace {

void putBE32(std::vector<uint8_t> &out, size_t at, uint32_t value) {
  out[at] = static_cast<uint8_t>(value >> 24);
  out[at + 1] = static_cast<uint8_t>(value >> 16);
  out[at + 2] = static_cast<uint8_t>(value >> 8);
  out[at + 3] = static_cast<uint8_t>(value);
}

// ERRC0100 as the API fills it: bytes available, exception id, reserved
// byte and the message replacement data.
std::vector<uint8_t> filledErrorCode(const std::string &id,
                                     const std::string &data) {
  std::vector<uint8_t> errorCode = AS400Engine::makeErrorCode();
  std::vector<uint8_t> encoded;
  EbcdicUtils::appendEncoded(encoded, id);
  std::copy(encoded.begin(), encoded.end(), errorCode.begin() + 8);
  encoded.clear();
  EbcdicUtils::appendEncoded(encoded, data);
  std::copy(encoded.begin(), encoded.end(), errorCode.begin() + 16);
  putBE32(errorCode, 4, static_cast<uint32_t>(16 + data.size()));
  return errorCode;
}

// Serves a value the way SQLGetData does for SQL_C_CHAR: each call fills
// the buffer with a terminated chunk and reports the bytes still left.
class ChunkedColumn {
public:
  explicit ChunkedColumn(std::string value) : value_(std::move(value)) {}

  SQLRETURN operator()(char *buffer, SQLLEN bufferLength, SQLLEN *len) {
    ++calls;
    if (served_ >= value_.size() && served_ > 0)
      return SQL_NO_DATA;
    size_t left = value_.size() - served_;
    size_t chunk = std::min(left, static_cast<size_t>(bufferLength - 1));
    std::copy(value_.begin() + served_, value_.begin() + served_ + chunk,
              buffer);
    buffer[chunk] = '\0';
    *len = static_cast<SQLLEN>(left);
    served_ += chunk;
    return chunk < left ? SQL_SUCCESS_WITH_INFO : SQL_SUCCESS;
  }

  int calls = 0;

private:
  std::string value_;
  size_t served_ = 0;
};

} // namespace

void testEmptyErrorCode() {
  std::cout << "Testing AS400Engine - untouched error code...\n";
  std::vector<uint8_t> errorCode = AS400Engine::makeErrorCode();
  assert(errorCode.size() == AS400Engine::ERROR_CODE_SIZE);
  assert(errorCode[2] == 0x02 && errorCode[3] == 0x10 &&
         "Bytes provided is 528");
  assert(AS400Engine::parseErrorCode(errorCode).empty());
  assert(AS400Engine::parseErrorCode({0, 0}).empty());
  std::cout << "✓ untouched error code test passed\n";
}

void testExceptionInErrorCode() {
  std::cout << "Testing AS400Engine - exception in error code...\n";
  std::vector<JournalMessage> messages = AS400Engine::parseErrorCode(
      filledErrorCode("CPF7062", "QSQJRN    SALES     "));
  assert(messages.size() == 1);
  assert(messages[0].id && *messages[0].id == "CPF7062");
  assert(messages[0].text == "QSQJRN    SALES");
  assert(classifyMessage(messages[0].id) ==
         MessageClassification::NO_DATA_AFTER_FILTERING);

  messages = AS400Engine::parseErrorCode(filledErrorCode("       ", "x"));
  assert(messages.size() == 1 && !messages[0].id &&
         "Blank exception id is reported without an identifier");
  assert(classifyMessage(messages[0].id) ==
         MessageClassification::MISSING_IDENTIFIER);
  std::cout << "✓ exception in error code test passed\n";
}

void testMessageIdFromDiagnostics() {
  std::cout << "Testing AS400Engine - message id from SQL diagnostics...\n";
  auto id = AS400Engine::extractMessageId(
      "[IBM][System i Access ODBC Driver][DB2 for i5/OS]SQL0443 - "
      "CPF7053 Values for RCVRNG not valid.");
  assert(id && *id == "SQL0443" && "First identifier wins");

  id = AS400Engine::extractMessageId("Journal entries not found: CPF9801.");
  assert(id && *id == "CPF9801");

  assert(!AS400Engine::extractMessageId("Communication link failure"));
  assert(!AS400Engine::extractMessageId("XCPF7053Y"));
  std::cout << "✓ message id from SQL diagnostics test passed\n";
}

void testReadCharCellInChunks() {
  std::cout << "Testing AS400Engine - chunked cell reads...\n";

  std::string longValue(2500, 'R');
  longValue.replace(2490, 10, "RCV0000042");
  ChunkedColumn longColumn(longValue + "   ");
  std::string cell = AS400Engine::readCharCell(std::ref(longColumn));
  assert(cell.size() == 2500 && "Long value is read past the buffer size");
  assert(cell == longValue && "Trailing blanks are trimmed");
  assert(longColumn.calls == 3);

  ChunkedColumn shortColumn("QSQJRN    ");
  assert(AS400Engine::readCharCell(std::ref(shortColumn)) == "QSQJRN");
  assert(shortColumn.calls == 1);

  auto nullColumn = [](char *, SQLLEN, SQLLEN *len) -> SQLRETURN {
    *len = SQL_NULL_DATA;
    return SQL_SUCCESS;
  };
  assert(AS400Engine::readCharCell(nullColumn) == "NULL");

  auto failingColumn = [](char *, SQLLEN, SQLLEN *) -> SQLRETURN {
    return SQL_ERROR;
  };
  assert(AS400Engine::readCharCell(failingColumn) == "NULL");

  std::cout << "✓ chunked cell read test passed\n";
}

int main() {
  try {
    testEmptyErrorCode();
    testExceptionInErrorCode();
    testMessageIdFromDiagnostics();
    testReadCharCellInChunks();
    std::cout << "\n✅ All AS400 message tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
