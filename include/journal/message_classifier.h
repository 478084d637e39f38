#ifndef MESSAGE_CLASSIFIER_H
#define MESSAGE_CLASSIFIER_H

#include <optional>
#include <string>

enum class MessageClassification {
  INVALID_POSITION,
  INVALID_FILTER,
  NO_DATA_AFTER_FILTERING,
  UNCLASSIFIED,
  MISSING_IDENTIFIER
};

namespace JournalMessageIds {
constexpr const char *SEQUENCE_NOT_FOUND = "CPF7053";
constexpr const char *INVALID_RECEIVER = "CPF9801";
constexpr const char *INVALID_OFFSET_RANGE = "CPF7054";
constexpr const char *FILTER_TARGET_MISSING = "CPF7060";
constexpr const char *NO_DATA_AFTER_FILTERING = "CPF7062";
} // namespace JournalMessageIds

MessageClassification classifyMessage(const std::optional<std::string> &id);
std::string toString(MessageClassification classification);

#endif
