#ifndef RETRIEVAL_CRITERIA_H
#define RETRIEVAL_CRITERIA_H

#include <string>

struct JournalInfo {
  std::string journalName;
  std::string journalLibrary;

  std::string qualifiedName() const {
    return journalLibrary + "/" + journalName;
  }
};

// Object filter sent with the retrieval call. Names are IBM i system names
// (10 characters), not SQL long names.
struct FileFilter {
  std::string schema;
  std::string table;
  std::string member{"*FIRST"};

  bool operator==(const FileFilter &other) const {
    return schema == other.schema && table == other.table &&
           member == other.member;
  }
};

enum class JournalCode { D, R, C, F, J, UNKNOWN };

enum class JournalEntryType {
  PT, // record added
  PX, // record added by RRN
  UP, // after image
  UB, // before image
  DL, // record deleted
  DR, // record deleted for rollback
  CT, // file created
  CG, // file changed
  SC, // commit start
  CM, // commit
  RB, // rollback
  ALL,
  UNKNOWN
};

JournalCode journalCodeFromString(const std::string &code);
JournalEntryType journalEntryTypeFromString(const std::string &type);
std::string toString(JournalCode code);
std::string toString(JournalEntryType type);

// Entries a change capture consumer must see: record images, file
// create/change and commitment control boundaries.
bool isRequiredEntry(JournalCode code, JournalEntryType type);

#endif
