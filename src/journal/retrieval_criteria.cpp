#include "journal/retrieval_criteria.h"
#include <unordered_map>

namespace {

const std::unordered_map<std::string, JournalEntryType> entryTypeMap = {
    {"PT", JournalEntryType::PT}, {"PX", JournalEntryType::PX},
    {"UP", JournalEntryType::UP}, {"UB", JournalEntryType::UB},
    {"DL", JournalEntryType::DL}, {"DR", JournalEntryType::DR},
    {"CT", JournalEntryType::CT}, {"CG", JournalEntryType::CG},
    {"SC", JournalEntryType::SC}, {"CM", JournalEntryType::CM},
    {"RB", JournalEntryType::RB}, {"*ALL", JournalEntryType::ALL}};

} // namespace

JournalCode journalCodeFromString(const std::string &code) {
  if (code.size() != 1)
    return JournalCode::UNKNOWN;
  switch (code[0]) {
  case 'D':
    return JournalCode::D;
  case 'R':
    return JournalCode::R;
  case 'C':
    return JournalCode::C;
  case 'F':
    return JournalCode::F;
  case 'J':
    return JournalCode::J;
  default:
    return JournalCode::UNKNOWN;
  }
}

JournalEntryType journalEntryTypeFromString(const std::string &type) {
  auto it = entryTypeMap.find(type);
  return it != entryTypeMap.end() ? it->second : JournalEntryType::UNKNOWN;
}

std::string toString(JournalCode code) {
  switch (code) {
  case JournalCode::D:
    return "D";
  case JournalCode::R:
    return "R";
  case JournalCode::C:
    return "C";
  case JournalCode::F:
    return "F";
  case JournalCode::J:
    return "J";
  default:
    return "?";
  }
}

std::string toString(JournalEntryType type) {
  for (const auto &entry : entryTypeMap) {
    if (entry.second == type)
      return entry.first;
  }
  return "??";
}

bool isRequiredEntry(JournalCode code, JournalEntryType type) {
  switch (code) {
  case JournalCode::R:
    return type == JournalEntryType::PT || type == JournalEntryType::PX ||
           type == JournalEntryType::UP || type == JournalEntryType::UB ||
           type == JournalEntryType::DL || type == JournalEntryType::DR;
  case JournalCode::D:
    return type == JournalEntryType::CT || type == JournalEntryType::CG;
  case JournalCode::C:
    return type == JournalEntryType::SC || type == JournalEntryType::CM ||
           type == JournalEntryType::RB;
  default:
    return false;
  }
}
