#ifndef JOURNAL_EXCEPTIONS_H
#define JOURNAL_EXCEPTIONS_H

#include <stdexcept>
#include <string>

class JournalException : public std::runtime_error {
public:
  explicit JournalException(const std::string &msg) : std::runtime_error(msg) {}
};

// The cursor no longer resolves against the live journal, e.g. its receiver
// was deleted. Needs operator intervention.
class InvalidPositionException : public JournalException {
public:
  explicit InvalidPositionException(const std::string &msg)
      : JournalException(msg) {}
};

// A configured file filter names an object that is missing or not journaled.
class InvalidJournalFilterException : public JournalException {
public:
  explicit InvalidJournalFilterException(const std::string &msg)
      : JournalException(msg) {}
};

class RetrieveJournalException : public JournalException {
public:
  explicit RetrieveJournalException(const std::string &msg)
      : JournalException(msg) {}
};

class JournalDecodeException : public JournalException {
public:
  explicit JournalDecodeException(const std::string &msg)
      : JournalException(msg) {}
};

class RetrievalInterruptedException : public JournalException {
public:
  explicit RetrievalInterruptedException(const std::string &msg)
      : JournalException(msg) {}
};

#endif
