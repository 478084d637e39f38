#include "core/journal_sync_config.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>

using json = nlohmann::json;

std::string JournalSyncConfig::postgres_host_ = "localhost";
std::string JournalSyncConfig::postgres_db_ = "DataLake";
std::string JournalSyncConfig::postgres_user_ = "postgres";
std::string JournalSyncConfig::postgres_password_ = "";
std::string JournalSyncConfig::postgres_port_ = "5432";
std::string JournalSyncConfig::as400_connection_string_ = "";
std::string JournalSyncConfig::retrieve_procedure_ = "QGPL.RTVJRNE";
std::string JournalSyncConfig::journal_name_ = "";
std::string JournalSyncConfig::journal_library_ = "";
size_t JournalSyncConfig::buffer_size_ = JournalSyncConfig::DEFAULT_BUFFER_SIZE;
uint64_t JournalSyncConfig::max_server_side_entries_ =
    JournalSyncConfig::DEFAULT_MAX_SERVER_SIDE_ENTRIES;
bool JournalSyncConfig::filtering_ = false;
std::string JournalSyncConfig::include_schema_ = "";
std::vector<std::string> JournalSyncConfig::include_tables_;
std::string JournalSyncConfig::dump_folder_ = "";
size_t JournalSyncConfig::poll_interval_ms_ =
    JournalSyncConfig::DEFAULT_POLL_INTERVAL_MS;
std::string JournalSyncConfig::log_level_ = "INFO";
std::string JournalSyncConfig::log_file_ = "";
bool JournalSyncConfig::initialized_ = false;
std::recursive_mutex JournalSyncConfig::configMutex_;

namespace {

bool validatePort(const std::string &portStr) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::stoi(portStr);
  return portNum > 0 && portNum <= 65535;
}

std::string portToString(const json &value) {
  if (value.is_number_integer())
    return std::to_string(value.get<int>());
  return value.get<std::string>();
}

} // namespace

std::string JournalSyncConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

void JournalSyncConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "JournalSyncConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
    loadFromEnv();
    return;
  }

  try {
    json config;
    configFile >> config;
    loadFromJson(config);
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "JournalSyncConfig",
                  "Error parsing config file: " + std::string(e.what()) +
                      ", falling back to environment variables");
  }
  loadFromEnv();
}

void JournalSyncConfig::loadFromJson(const json &config) {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);

  if (config.contains("database") && config["database"].contains("postgres")) {
    const auto &pg = config["database"]["postgres"];
    if (pg.contains("host") && !pg["host"].get<std::string>().empty())
      postgres_host_ = pg["host"].get<std::string>();
    if (pg.contains("port")) {
      std::string port = portToString(pg["port"]);
      if (validatePort(port)) {
        postgres_port_ = port;
      } else {
        Logger::warning(LogCategory::CONFIG, "JournalSyncConfig",
                        "Invalid port number: " + port +
                            ", using default: 5432");
      }
    }
    if (pg.contains("database") && !pg["database"].get<std::string>().empty())
      postgres_db_ = pg["database"].get<std::string>();
    if (pg.contains("user") && !pg["user"].get<std::string>().empty())
      postgres_user_ = pg["user"].get<std::string>();
    if (pg.contains("password"))
      postgres_password_ = pg["password"].get<std::string>();
  }

  if (config.contains("as400")) {
    const auto &as400 = config["as400"];
    as400_connection_string_ =
        as400.value("connection_string", as400_connection_string_);
    retrieve_procedure_ = as400.value("retrieve_procedure", retrieve_procedure_);
  }

  if (config.contains("journal")) {
    const auto &journal = config["journal"];
    if (journal.contains("name") || journal.contains("library")) {
      setJournal(journal.value("name", journal_name_),
                 journal.value("library", journal_library_));
    }
    if (journal.contains("buffer_size"))
      setBufferSize(journal["buffer_size"].get<size_t>());
    if (journal.contains("max_server_side_entries"))
      setMaxServerSideEntries(
          journal["max_server_side_entries"].get<uint64_t>());
    if (journal.contains("poll_interval_ms"))
      setPollIntervalMs(journal["poll_interval_ms"].get<size_t>());
    filtering_ = journal.value("filtering", filtering_);
    include_schema_ =
        StringUtils::toUpper(journal.value("include_schema", include_schema_));
    if (journal.contains("include_tables"))
      setIncludeTables(journal["include_tables"].get<std::string>());
    dump_folder_ = journal.value("dump_folder", dump_folder_);
  }

  if (config.contains("logging")) {
    log_level_ = config["logging"].value("level", log_level_);
    log_file_ = config["logging"].value("file", log_file_);
  }

  initialized_ = true;
}

void JournalSyncConfig::loadFromEnv() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);

  const char *host = std::getenv("POSTGRES_HOST");
  const char *port = std::getenv("POSTGRES_PORT");
  const char *db = std::getenv("POSTGRES_DB");
  const char *user = std::getenv("POSTGRES_USER");
  const char *password = std::getenv("POSTGRES_PASSWORD");

  if (host && strlen(host) > 0)
    postgres_host_ = host;
  if (port && strlen(port) > 0) {
    if (validatePort(port)) {
      postgres_port_ = port;
    } else {
      Logger::warning(LogCategory::CONFIG, "JournalSyncConfig",
                      "Invalid port number: " + std::string(port) +
                          ", using default: 5432");
    }
  }
  if (db && strlen(db) > 0)
    postgres_db_ = db;
  if (user && strlen(user) > 0)
    postgres_user_ = user;
  if (password)
    postgres_password_ = password;

  const char *as400 = std::getenv("AS400_CONNECTION_STRING");
  const char *journalName = std::getenv("JOURNAL_NAME");
  const char *journalLibrary = std::getenv("JOURNAL_LIBRARY");
  const char *dumpFolder = std::getenv("JOURNAL_DUMP_FOLDER");

  if (as400 && strlen(as400) > 0)
    as400_connection_string_ = as400;
  if ((journalName && strlen(journalName) > 0) ||
      (journalLibrary && strlen(journalLibrary) > 0)) {
    setJournal(journalName && strlen(journalName) > 0 ? journalName
                                                      : journal_name_,
               journalLibrary && strlen(journalLibrary) > 0 ? journalLibrary
                                                            : journal_library_);
  }
  if (dumpFolder)
    dump_folder_ = dumpFolder;

  if (postgres_password_.empty()) {
    Logger::warning(
        LogCategory::CONFIG, "JournalSyncConfig",
        "POSTGRES_PASSWORD not set in config.json or environment. "
        "Offsets cannot be stored without a database connection.");
  }

  initialized_ = true;
}

void JournalSyncConfig::reset() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  postgres_host_ = "localhost";
  postgres_db_ = "DataLake";
  postgres_user_ = "postgres";
  postgres_password_.clear();
  postgres_port_ = "5432";
  as400_connection_string_.clear();
  retrieve_procedure_ = "QGPL.RTVJRNE";
  journal_name_.clear();
  journal_library_.clear();
  buffer_size_ = DEFAULT_BUFFER_SIZE;
  max_server_side_entries_ = DEFAULT_MAX_SERVER_SIDE_ENTRIES;
  filtering_ = false;
  include_schema_.clear();
  include_tables_.clear();
  dump_folder_.clear();
  poll_interval_ms_ = DEFAULT_POLL_INTERVAL_MS;
  log_level_ = "INFO";
  log_file_.clear();
  initialized_ = false;
}

void JournalSyncConfig::setBufferSize(size_t bytes) {
  if (bytes < MIN_BUFFER_SIZE || bytes > MAX_BUFFER_SIZE) {
    throw std::invalid_argument("buffer_size must be between " +
                                std::to_string(MIN_BUFFER_SIZE) + " and " +
                                std::to_string(MAX_BUFFER_SIZE));
  }
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  buffer_size_ = bytes;
}

void JournalSyncConfig::setMaxServerSideEntries(uint64_t entries) {
  if (entries < MIN_MAX_SERVER_SIDE_ENTRIES ||
      entries > MAX_MAX_SERVER_SIDE_ENTRIES) {
    throw std::invalid_argument(
        "max_server_side_entries must be between " +
        std::to_string(MIN_MAX_SERVER_SIDE_ENTRIES) + " and " +
        std::to_string(MAX_MAX_SERVER_SIDE_ENTRIES));
  }
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  max_server_side_entries_ = entries;
}

void JournalSyncConfig::setPollIntervalMs(size_t ms) {
  if (ms < MIN_POLL_INTERVAL_MS || ms > MAX_POLL_INTERVAL_MS) {
    throw std::invalid_argument("poll_interval_ms must be between " +
                                std::to_string(MIN_POLL_INTERVAL_MS) +
                                " and " +
                                std::to_string(MAX_POLL_INTERVAL_MS));
  }
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  poll_interval_ms_ = ms;
}

void JournalSyncConfig::setJournal(const std::string &name,
                                   const std::string &library) {
  std::string upperName = StringUtils::toUpper(StringUtils::trim(name));
  std::string upperLibrary = StringUtils::toUpper(StringUtils::trim(library));
  if (!upperName.empty() && !StringUtils::isValidSystemName(upperName)) {
    throw std::invalid_argument("Invalid journal name: " + name);
  }
  if (!upperLibrary.empty() && !StringUtils::isValidSystemName(upperLibrary)) {
    throw std::invalid_argument("Invalid journal library: " + library);
  }
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  journal_name_ = upperName;
  journal_library_ = upperLibrary;
}

void JournalSyncConfig::setIncludeTables(const std::string &commaList) {
  std::vector<std::string> tables = StringUtils::split(commaList, ',');
  for (auto &table : tables) {
    table = StringUtils::toUpper(table);
  }
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  include_tables_ = std::move(tables);
}

size_t JournalSyncConfig::getBufferSize() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return buffer_size_;
}

uint64_t JournalSyncConfig::getMaxServerSideEntries() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return max_server_side_entries_;
}

size_t JournalSyncConfig::getPollIntervalMs() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return poll_interval_ms_;
}

std::string JournalSyncConfig::getJournalName() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return journal_name_;
}

std::string JournalSyncConfig::getJournalLibrary() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return journal_library_;
}

bool JournalSyncConfig::isFiltering() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return filtering_;
}

std::string JournalSyncConfig::getIncludeSchema() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return include_schema_;
}

std::vector<std::string> JournalSyncConfig::getIncludeTables() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return include_tables_;
}

std::string JournalSyncConfig::getDumpFolder() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return dump_folder_;
}

std::string JournalSyncConfig::getAS400ConnectionString() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return as400_connection_string_;
}

std::string JournalSyncConfig::getRetrieveProcedure() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return retrieve_procedure_;
}

std::string JournalSyncConfig::getLogLevel() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return log_level_;
}

std::string JournalSyncConfig::getLogFile() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return log_file_;
}

bool JournalSyncConfig::isInitialized() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return initialized_;
}

std::string JournalSyncConfig::getPostgresConnectionString() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return "host=" + escapeConnectionParam(postgres_host_) +
         " dbname=" + escapeConnectionParam(postgres_db_) +
         " user=" + escapeConnectionParam(postgres_user_) +
         " password=" + escapeConnectionParam(postgres_password_) +
         " port=" + escapeConnectionParam(postgres_port_);
}

std::string JournalSyncConfig::getPostgresConnectionStringForLogging() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  return "host=" + escapeConnectionParam(postgres_host_) +
         " dbname=" + escapeConnectionParam(postgres_db_) +
         " user=" + escapeConnectionParam(postgres_user_) +
         " password=*** port=" + escapeConnectionParam(postgres_port_);
}

void JournalSyncConfig::validate() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  if (journal_name_.empty() || journal_library_.empty()) {
    throw std::invalid_argument(
        "journal.name and journal.library must be configured");
  }
  if (as400_connection_string_.empty()) {
    throw std::invalid_argument("as400.connection_string must be configured");
  }
  if (filtering_ && include_tables_.empty()) {
    Logger::warning(LogCategory::CONFIG, "JournalSyncConfig",
                    "journal.filtering is on but include_tables is empty, "
                    "all entries will be retrieved");
  }
}

RetrieveConfig JournalSyncConfig::toRetrieveConfig() {
  std::lock_guard<std::recursive_mutex> lock(configMutex_);
  RetrieveConfig config;
  config.journal = JournalInfo{journal_name_, journal_library_};
  config.bufferSize = buffer_size_;
  config.maxServerSideEntries = max_server_side_entries_;
  config.filtering = filtering_;
  config.dumpFolder = dump_folder_;
  return config;
}
