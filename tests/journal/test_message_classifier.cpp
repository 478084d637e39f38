#include "journal/message_classifier.h"
#include <cassert>
#include <iostream>

void testKnownIdentifiers() {
  std::cout << "Testing classifyMessage - known identifiers...\n";

  assert(classifyMessage(std::string("CPF7053")) ==
         MessageClassification::INVALID_POSITION);
  assert(classifyMessage(std::string("CPF9801")) ==
         MessageClassification::INVALID_POSITION);
  assert(classifyMessage(std::string("CPF7054")) ==
         MessageClassification::INVALID_POSITION);
  assert(classifyMessage(std::string("CPF7060")) ==
         MessageClassification::INVALID_FILTER);
  assert(classifyMessage(std::string("CPF7062")) ==
         MessageClassification::NO_DATA_AFTER_FILTERING);

  std::cout << "✓ known identifiers test passed\n";
}

void testUnknownAndMissing() {
  std::cout << "Testing classifyMessage - unknown and missing...\n";

  assert(classifyMessage(std::string("CPF9999")) ==
         MessageClassification::UNCLASSIFIED);
  assert(classifyMessage(std::string("cpf7053")) ==
         MessageClassification::UNCLASSIFIED &&
         "Identifiers are matched exactly");
  assert(classifyMessage(std::nullopt) ==
         MessageClassification::MISSING_IDENTIFIER);
  assert(toString(MessageClassification::MISSING_IDENTIFIER) ==
         "MISSING_IDENTIFIER");

  std::cout << "✓ unknown and missing test passed\n";
}

int main() {
  try {
    testKnownIdentifiers();
    testUnknownAndMissing();
    std::cout << "\n✅ All message classifier tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
