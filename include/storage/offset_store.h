#ifndef OFFSET_STORE_H
#define OFFSET_STORE_H

#include "journal/journal_position.h"
#include "journal/retrieval_criteria.h"
#include <optional>
#include <pqxx/pqxx>
#include <string>

class IOffsetStore {
public:
  virtual ~IOffsetStore() = default;

  virtual std::optional<JournalPosition> load(const std::string &key) = 0;
  virtual void save(const std::string &key,
                    const JournalPosition &position) = 0;
};

// Positions are stored as JSON in metadata.journal_offsets, one row per key.
class PostgresOffsetStore : public IOffsetStore {
public:
  explicit PostgresOffsetStore(std::string connectionString);

  std::optional<JournalPosition> load(const std::string &key) override;
  void save(const std::string &key, const JournalPosition &position) override;

private:
  void ensureTable(pqxx::connection &conn);

  std::string connectionString_;
  bool tableReady_{false};
};

std::string offsetKey(const JournalInfo &journal);

#endif
