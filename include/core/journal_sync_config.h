#ifndef JOURNAL_SYNC_CONFIG_H
#define JOURNAL_SYNC_CONFIG_H

#include "journal/journal_retriever.h"
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

class JournalSyncConfig {
private:
  static std::string postgres_host_;
  static std::string postgres_db_;
  static std::string postgres_user_;
  static std::string postgres_password_;
  static std::string postgres_port_;

  static std::string as400_connection_string_;
  static std::string retrieve_procedure_;

  static std::string journal_name_;
  static std::string journal_library_;
  static size_t buffer_size_;
  static uint64_t max_server_side_entries_;
  static bool filtering_;
  static std::string include_schema_;
  static std::vector<std::string> include_tables_;
  static std::string dump_folder_;
  static size_t poll_interval_ms_;

  static std::string log_level_;
  static std::string log_file_;

  static bool initialized_;
  static std::recursive_mutex configMutex_;

  static std::string escapeConnectionParam(const std::string &param);

public:
  static constexpr size_t DEFAULT_BUFFER_SIZE = 65536;
  static constexpr uint64_t DEFAULT_MAX_SERVER_SIDE_ENTRIES = 1000;
  static constexpr size_t DEFAULT_POLL_INTERVAL_MS = 1000;

  static constexpr size_t MIN_BUFFER_SIZE = 32 * 1024;
  static constexpr size_t MAX_BUFFER_SIZE = 16 * 1024 * 1024;
  static constexpr uint64_t MIN_MAX_SERVER_SIDE_ENTRIES = 1;
  static constexpr uint64_t MAX_MAX_SERVER_SIDE_ENTRIES = 1000000;
  static constexpr size_t MIN_POLL_INTERVAL_MS = 10;
  static constexpr size_t MAX_POLL_INTERVAL_MS = 3600000;

  // Reads config.json, falling back to the environment when the file is
  // missing or unreadable. Environment variables override file values.
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();
  static void reset();

  static void setBufferSize(size_t bytes);
  static void setMaxServerSideEntries(uint64_t entries);
  static void setPollIntervalMs(size_t ms);
  static void setJournal(const std::string &name, const std::string &library);
  static void setIncludeTables(const std::string &commaList);

  static size_t getBufferSize();
  static uint64_t getMaxServerSideEntries();
  static size_t getPollIntervalMs();
  static std::string getJournalName();
  static std::string getJournalLibrary();
  static bool isFiltering();
  static std::string getIncludeSchema();
  static std::vector<std::string> getIncludeTables();
  static std::string getDumpFolder();
  static std::string getAS400ConnectionString();
  static std::string getRetrieveProcedure();
  static std::string getLogLevel();
  static std::string getLogFile();
  static bool isInitialized();

  static std::string getPostgresConnectionString();
  static std::string getPostgresConnectionStringForLogging();

  // Throws std::invalid_argument when the settings cannot drive a journal
  // retrieval, e.g. no journal configured.
  static void validate();

  // File filters are left empty; they need system name resolution.
  static RetrieveConfig toRetrieveConfig();
};

#endif
