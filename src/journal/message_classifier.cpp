#include "journal/message_classifier.h"

MessageClassification classifyMessage(const std::optional<std::string> &id) {
  if (!id) {
    return MessageClassification::MISSING_IDENTIFIER;
  }
  if (*id == JournalMessageIds::SEQUENCE_NOT_FOUND ||
      *id == JournalMessageIds::INVALID_RECEIVER ||
      *id == JournalMessageIds::INVALID_OFFSET_RANGE) {
    return MessageClassification::INVALID_POSITION;
  }
  if (*id == JournalMessageIds::FILTER_TARGET_MISSING) {
    return MessageClassification::INVALID_FILTER;
  }
  if (*id == JournalMessageIds::NO_DATA_AFTER_FILTERING) {
    return MessageClassification::NO_DATA_AFTER_FILTERING;
  }
  return MessageClassification::UNCLASSIFIED;
}

std::string toString(MessageClassification classification) {
  switch (classification) {
  case MessageClassification::INVALID_POSITION:
    return "INVALID_POSITION";
  case MessageClassification::INVALID_FILTER:
    return "INVALID_FILTER";
  case MessageClassification::NO_DATA_AFTER_FILTERING:
    return "NO_DATA_AFTER_FILTERING";
  case MessageClassification::UNCLASSIFIED:
    return "UNCLASSIFIED";
  case MessageClassification::MISSING_IDENTIFIER:
    return "MISSING_IDENTIFIER";
  default:
    return "UNKNOWN";
  }
}
