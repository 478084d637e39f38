#include "storage/offset_store.h"
#include "core/logger.h"

std::string offsetKey(const JournalInfo &journal) {
  return "journal:" + journal.qualifiedName();
}

PostgresOffsetStore::PostgresOffsetStore(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

void PostgresOffsetStore::ensureTable(pqxx::connection &conn) {
  if (tableReady_)
    return;
  pqxx::work txn(conn);
  txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
  txn.exec("CREATE TABLE IF NOT EXISTS metadata.journal_offsets ("
           "offset_key VARCHAR(255) PRIMARY KEY, "
           "position JSONB NOT NULL, "
           "updated_at TIMESTAMP NOT NULL DEFAULT NOW())");
  txn.commit();
  tableReady_ = true;
}

std::optional<JournalPosition>
PostgresOffsetStore::load(const std::string &key) {
  try {
    pqxx::connection conn(connectionString_);
    ensureTable(conn);

    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "SELECT position::text FROM metadata.journal_offsets "
        "WHERE offset_key = $1",
        key);
    txn.commit();

    if (result.empty() || result[0][0].is_null()) {
      Logger::info(LogCategory::OFFSETS, "PostgresOffsetStore::load",
                   "No stored offset for " + key);
      return std::nullopt;
    }

    JournalPosition position =
        json::parse(result[0][0].as<std::string>()).get<JournalPosition>();
    Logger::info(LogCategory::OFFSETS, "PostgresOffsetStore::load",
                 "Loaded " + position.toString() + " for " + key);
    return position;
  } catch (const pqxx::sql_error &e) {
    Logger::error(LogCategory::OFFSETS, "PostgresOffsetStore::load",
                  "SQL error loading offset for " + key + ": " + e.what() +
                      " [SQL State: " + e.sqlstate() + "]");
    throw;
  } catch (const json::exception &e) {
    Logger::error(LogCategory::OFFSETS, "PostgresOffsetStore::load",
                  "Stored offset for " + key + " is not valid: " + e.what());
    throw;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::OFFSETS, "PostgresOffsetStore::load",
                  "Error loading offset for " + key + ": " + e.what());
    throw;
  }
}

void PostgresOffsetStore::save(const std::string &key,
                               const JournalPosition &position) {
  try {
    pqxx::connection conn(connectionString_);
    ensureTable(conn);

    json value = position;
    pqxx::work txn(conn);
    txn.exec_params(
        "INSERT INTO metadata.journal_offsets (offset_key, position, "
        "updated_at) VALUES ($1, $2::jsonb, NOW()) "
        "ON CONFLICT (offset_key) DO UPDATE SET "
        "position = EXCLUDED.position, updated_at = NOW()",
        key, value.dump());
    txn.commit();

    Logger::debug(LogCategory::OFFSETS, "PostgresOffsetStore::save",
                  "Saved " + position.toString() + " for " + key);
  } catch (const pqxx::sql_error &e) {
    Logger::error(LogCategory::OFFSETS, "PostgresOffsetStore::save",
                  "SQL error saving offset for " + key + ": " + e.what() +
                      " [SQL State: " + e.sqlstate() + "]");
    throw;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::OFFSETS, "PostgresOffsetStore::save",
                  "Error saving offset for " + key + ": " + e.what());
    throw;
  }
}
