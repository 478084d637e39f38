#include "engines/as400_engine.h"
#include "journal/journal_exceptions.h"
#include "utils/ebcdic.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <chrono>
#include <regex>
#include <thread>

namespace {

constexpr int ODBC_BUFFER_SIZE = 1024;

constexpr size_t ERRC_BYTES_PROVIDED = 0;
constexpr size_t ERRC_BYTES_AVAILABLE = 4;
constexpr size_t ERRC_EXCEPTION_ID = 8;
constexpr size_t ERRC_EXCEPTION_ID_LENGTH = 7;
constexpr size_t ERRC_EXCEPTION_DATA = 16;

uint32_t readBE32(const std::vector<uint8_t> &data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

std::vector<JournalMessage> collectDiagnostics(SQLSMALLINT handleType,
                                               SQLHANDLE handle) {
  std::vector<JournalMessage> messages;
  SQLCHAR sqlState[6];
  SQLCHAR msg[SQL_MAX_MESSAGE_LENGTH];
  SQLINTEGER nativeError;
  SQLSMALLINT msgLen;

  for (SQLSMALLINT i = 1;
       SQL_SUCCEEDED(SQLGetDiagRec(handleType, handle, i, sqlState,
                                   &nativeError, msg, sizeof(msg), &msgLen));
       ++i) {
    JournalMessage message;
    message.text = std::string(reinterpret_cast<char *>(msg));
    message.help = "SQLSTATE " + std::string(reinterpret_cast<char *>(sqlState)) +
                   " native " + std::to_string(nativeError);
    message.id = AS400Engine::extractMessageId(message.text);
    messages.push_back(std::move(message));
  }
  return messages;
}

uint64_t toSequence(const std::string &value) {
  if (value.empty() || value == "NULL")
    return 0;
  try {
    return std::stoull(value);
  } catch (const std::exception &) {
    Logger::warning(LogCategory::DATABASE, "AS400Engine",
                    "Unparseable sequence number: " + value);
    return 0;
  }
}

} // namespace

AS400ODBCConnection::AS400ODBCConnection(const std::string &connectionString) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
  if (!SQL_SUCCEEDED(ret)) {
    Logger::error(LogCategory::DATABASE, "AS400ODBCConnection",
                  "Failed to allocate environment handle");
    return;
  }

  ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
  if (!SQL_SUCCEEDED(ret)) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
    Logger::error(LogCategory::DATABASE, "AS400ODBCConnection",
                  "Failed to set ODBC version");
    return;
  }

  ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
  if (!SQL_SUCCEEDED(ret)) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
    Logger::error(LogCategory::DATABASE, "AS400ODBCConnection",
                  "Failed to allocate connection handle");
    return;
  }

  SQLCHAR outConnStr[ODBC_BUFFER_SIZE];
  SQLSMALLINT outConnStrLen;
  ret = SQLDriverConnect(dbc_, nullptr, (SQLCHAR *)connectionString.c_str(),
                         SQL_NTS, outConnStr, sizeof(outConnStr),
                         &outConnStrLen, SQL_DRIVER_NOPROMPT);
  if (!SQL_SUCCEEDED(ret)) {
    SQLCHAR sqlState[6], msg[SQL_MAX_MESSAGE_LENGTH];
    SQLINTEGER nativeError;
    SQLSMALLINT msgLen;
    msg[0] = '\0';
    SQLGetDiagRec(SQL_HANDLE_DBC, dbc_, 1, sqlState, &nativeError, msg,
                  sizeof(msg), &msgLen);
    Logger::error(LogCategory::DATABASE, "AS400ODBCConnection",
                  "Connection failed: " + std::string((char *)msg));
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    dbc_ = SQL_NULL_HANDLE;
    env_ = SQL_NULL_HANDLE;
    return;
  }

  valid_ = true;
}

AS400ODBCConnection::~AS400ODBCConnection() {
  if (dbc_ != SQL_NULL_HANDLE) {
    SQLDisconnect(dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
  }
  if (env_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
  }
}

AS400ODBCConnection::AS400ODBCConnection(AS400ODBCConnection &&other) noexcept
    : env_(other.env_), dbc_(other.dbc_), valid_(other.valid_) {
  other.env_ = SQL_NULL_HANDLE;
  other.dbc_ = SQL_NULL_HANDLE;
  other.valid_ = false;
}

AS400ODBCConnection &
AS400ODBCConnection::operator=(AS400ODBCConnection &&other) noexcept {
  if (this != &other) {
    if (dbc_ != SQL_NULL_HANDLE) {
      SQLDisconnect(dbc_);
      SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    }
    if (env_ != SQL_NULL_HANDLE) {
      SQLFreeHandle(SQL_HANDLE_ENV, env_);
    }

    env_ = other.env_;
    dbc_ = other.dbc_;
    valid_ = other.valid_;

    other.env_ = SQL_NULL_HANDLE;
    other.dbc_ = SQL_NULL_HANDLE;
    other.valid_ = false;
  }
  return *this;
}

bool AS400ODBCConnection::isAlive() const {
  if (!valid_ || dbc_ == SQL_NULL_HANDLE)
    return false;
  SQLUINTEGER dead = SQL_CD_TRUE;
  SQLRETURN ret =
      SQLGetConnectAttr(dbc_, SQL_ATTR_CONNECTION_DEAD, &dead, 0, nullptr);
  return SQL_SUCCEEDED(ret) && dead == SQL_CD_FALSE;
}

AS400Engine::AS400Engine(std::string connectionString,
                         std::string retrieveProcedure)
    : connectionString_(std::move(connectionString)),
      retrieveProcedure_(std::move(retrieveProcedure)) {}

std::unique_ptr<AS400ODBCConnection> AS400Engine::createConnection() {
  const int MAX_RETRIES = 3;
  const int INITIAL_BACKOFF_MS = 100;

  for (int attempt = 1; attempt <= MAX_RETRIES; ++attempt) {
    auto conn = std::make_unique<AS400ODBCConnection>(connectionString_);
    if (conn->isValid()) {
      if (attempt > 1) {
        Logger::info(LogCategory::DATABASE, "AS400Engine",
                     "Connection successful on attempt " +
                         std::to_string(attempt));
      }
      return conn;
    }

    if (attempt < MAX_RETRIES) {
      int backoffMs = INITIAL_BACKOFF_MS * (1 << (attempt - 1));
      Logger::warning(LogCategory::DATABASE, "AS400Engine",
                      "Connection attempt " + std::to_string(attempt) +
                          " failed, retrying in " + std::to_string(backoffMs) +
                          "ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  Logger::error(LogCategory::DATABASE, "AS400Engine",
                "Failed to connect after " + std::to_string(MAX_RETRIES) +
                    " attempts");
  return nullptr;
}

AS400ODBCConnection *AS400Engine::connection() {
  if (connection_ && connection_->isAlive()) {
    return connection_.get();
  }
  if (connection_) {
    Logger::warning(LogCategory::DATABASE, "AS400Engine",
                    "Connection lost, reconnecting");
  }
  connection_ = createConnection();
  return connection_.get();
}

std::vector<std::vector<std::string>>
AS400Engine::executeQuery(SQLHDBC dbc, const std::string &query) {
  std::vector<std::vector<std::string>> results;
  if (!dbc)
    return results;

  SQLHSTMT stmt;
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt);
  if (!SQL_SUCCEEDED(ret)) {
    Logger::error(LogCategory::DATABASE, "AS400Engine",
                  "Failed to allocate statement handle");
    return results;
  }

  ret = SQLExecDirect(stmt, (SQLCHAR *)query.c_str(), SQL_NTS);
  if (!SQL_SUCCEEDED(ret)) {
    for (const auto &message : collectDiagnostics(SQL_HANDLE_STMT, stmt)) {
      Logger::error(LogCategory::DATABASE, "AS400Engine",
                    "Query execution failed: " + message.text);
    }
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    return results;
  }

  SQLSMALLINT numCols = 0;
  ret = SQLNumResultCols(stmt, &numCols);
  if (!SQL_SUCCEEDED(ret) || numCols <= 0) {
    Logger::error(LogCategory::DATABASE, "AS400Engine",
                  "SQLNumResultCols failed or no columns");
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    return results;
  }

  SQLRETURN fetchRet;
  while ((fetchRet = SQLFetch(stmt)) == SQL_SUCCESS ||
         fetchRet == SQL_SUCCESS_WITH_INFO) {
    std::vector<std::string> row;
    for (SQLSMALLINT i = 1; i <= numCols; i++) {
      row.push_back(readCharCell(
          [stmt, i](char *buffer, SQLLEN bufferLength, SQLLEN *len) {
            return SQLGetData(stmt, i, SQL_C_CHAR, buffer, bufferLength, len);
          }));
    }
    results.push_back(std::move(row));
  }

  if (fetchRet != SQL_NO_DATA && !SQL_SUCCEEDED(fetchRet)) {
    for (const auto &message : collectDiagnostics(SQL_HANDLE_STMT, stmt)) {
      Logger::error(LogCategory::DATABASE, "AS400Engine",
                    "SQLFetch failed: " + message.text);
    }
  }

  SQLFreeHandle(SQL_HANDLE_STMT, stmt);
  return results;
}

std::string AS400Engine::readCharCell(const CharChunkReader &read) {
  constexpr SQLLEN CHUNK_SIZE = ODBC_BUFFER_SIZE - 1;
  char buffer[ODBC_BUFFER_SIZE];
  std::string cell;
  SQLRETURN ret;
  do {
    SQLLEN len = 0;
    ret = read(buffer, sizeof(buffer), &len);
    if (ret == SQL_NO_DATA) {
      break;
    }
    if (!SQL_SUCCEEDED(ret) || len == SQL_NULL_DATA) {
      return "NULL";
    }
    // SQL_NO_TOTAL or a length past the buffer means this chunk is full
    bool full = len == SQL_NO_TOTAL || len > CHUNK_SIZE;
    cell.append(buffer, full ? CHUNK_SIZE : static_cast<size_t>(len));
    if (!full) {
      break;
    }
  } while (ret == SQL_SUCCESS_WITH_INFO);
  return StringUtils::trimRight(cell);
}

std::vector<uint8_t> AS400Engine::makeErrorCode() {
  std::vector<uint8_t> errorCode(ERROR_CODE_SIZE, 0);
  uint32_t provided = static_cast<uint32_t>(ERROR_CODE_SIZE);
  errorCode[ERRC_BYTES_PROVIDED] = static_cast<uint8_t>(provided >> 24);
  errorCode[ERRC_BYTES_PROVIDED + 1] = static_cast<uint8_t>(provided >> 16);
  errorCode[ERRC_BYTES_PROVIDED + 2] = static_cast<uint8_t>(provided >> 8);
  errorCode[ERRC_BYTES_PROVIDED + 3] = static_cast<uint8_t>(provided);
  return errorCode;
}

std::vector<JournalMessage>
AS400Engine::parseErrorCode(const std::vector<uint8_t> &errorCode) {
  std::vector<JournalMessage> messages;
  if (errorCode.size() < ERRC_EXCEPTION_DATA)
    return messages;

  uint32_t available = readBE32(errorCode, ERRC_BYTES_AVAILABLE);
  if (available == 0)
    return messages;

  JournalMessage message;
  std::string id = StringUtils::trim(EbcdicUtils::toAscii(
      errorCode.data() + ERRC_EXCEPTION_ID, ERRC_EXCEPTION_ID_LENGTH));
  if (!id.empty())
    message.id = id;

  size_t end = std::min<size_t>(available, errorCode.size());
  if (end > ERRC_EXCEPTION_DATA) {
    message.text = StringUtils::trim(EbcdicUtils::toAscii(
        errorCode.data() + ERRC_EXCEPTION_DATA, end - ERRC_EXCEPTION_DATA));
  }
  messages.push_back(std::move(message));
  return messages;
}

std::optional<std::string>
AS400Engine::extractMessageId(const std::string &text) {
  static const std::regex idPattern("\\b((CPF|CPD|CPI|MCH|SQL)[0-9A-F]{4})\\b");
  std::smatch match;
  if (std::regex_search(text, match, idPattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

RetrievalResponse AS400Engine::retrieveEntries(const RetrievalRequest &request) {
  RetrievalResponse response;

  AS400ODBCConnection *conn = connection();
  if (!conn) {
    throw RetrieveJournalException("No AS400 connection available for " +
                                   request.journal.qualifiedName());
  }

  SQLHSTMT stmt;
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn->getDbc(), &stmt);
  if (!SQL_SUCCEEDED(ret)) {
    throw RetrieveJournalException("Failed to allocate statement handle");
  }

  std::vector<uint8_t> receiver(request.bufferSize, 0);
  SQLLEN receiverLen = 0;
  SQLINTEGER receiverSize = static_cast<SQLINTEGER>(request.bufferSize);
  SQLLEN receiverSizeLen = 0;
  std::string journalName =
      StringUtils::padRight(request.journal.journalName, 10) +
      StringUtils::padRight(request.journal.journalLibrary, 10);
  SQLLEN journalNameLen = SQL_NTS;
  std::string format = StringUtils::padRight(request.formatName, 8);
  SQLLEN formatLen = SQL_NTS;
  std::vector<uint8_t> selection = request.selection;
  SQLLEN selectionLen = static_cast<SQLLEN>(selection.size());
  std::vector<uint8_t> errorCode = makeErrorCode();
  SQLLEN errorCodeLen = static_cast<SQLLEN>(errorCode.size());

  std::string call = "CALL " + retrieveProcedure_ + "(?, ?, ?, ?, ?, ?)";
  ret = SQLPrepare(stmt, (SQLCHAR *)call.c_str(), SQL_NTS);
  if (SQL_SUCCEEDED(ret))
    ret = SQLBindParameter(stmt, 1, SQL_PARAM_OUTPUT, SQL_C_BINARY,
                           SQL_VARBINARY, receiver.size(), 0, receiver.data(),
                           static_cast<SQLLEN>(receiver.size()), &receiverLen);
  if (SQL_SUCCEEDED(ret))
    ret = SQLBindParameter(stmt, 2, SQL_PARAM_INPUT, SQL_C_SLONG, SQL_INTEGER,
                           0, 0, &receiverSize, 0, &receiverSizeLen);
  if (SQL_SUCCEEDED(ret))
    ret = SQLBindParameter(stmt, 3, SQL_PARAM_INPUT, SQL_C_CHAR, SQL_CHAR,
                           journalName.size(), 0,
                           (SQLPOINTER)journalName.c_str(), 0, &journalNameLen);
  if (SQL_SUCCEEDED(ret))
    ret = SQLBindParameter(stmt, 4, SQL_PARAM_INPUT, SQL_C_CHAR, SQL_CHAR,
                           format.size(), 0, (SQLPOINTER)format.c_str(), 0,
                           &formatLen);
  if (SQL_SUCCEEDED(ret))
    ret = SQLBindParameter(stmt, 5, SQL_PARAM_INPUT, SQL_C_BINARY,
                           SQL_VARBINARY, selection.size(), 0, selection.data(),
                           selectionLen, &selectionLen);
  if (SQL_SUCCEEDED(ret))
    ret = SQLBindParameter(stmt, 6, SQL_PARAM_INPUT_OUTPUT, SQL_C_BINARY,
                           SQL_BINARY, errorCode.size(), 0, errorCode.data(),
                           errorCodeLen, &errorCodeLen);
  if (SQL_SUCCEEDED(ret)) {
    ret = SQLExecute(stmt);
  }

  if (!SQL_SUCCEEDED(ret)) {
    response.messages = collectDiagnostics(SQL_HANDLE_STMT, stmt);
    Logger::error(LogCategory::DATABASE, "AS400Engine::retrieveEntries",
                  "Call to " + retrieveProcedure_ + " failed for " +
                      request.description);
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    return response;
  }
  SQLFreeHandle(SQL_HANDLE_STMT, stmt);

  response.messages = parseErrorCode(errorCode);
  if (!response.messages.empty()) {
    return response;
  }

  if (receiverLen > 0 && static_cast<size_t>(receiverLen) < receiver.size()) {
    receiver.resize(static_cast<size_t>(receiverLen));
  }
  response.data = std::move(receiver);
  response.success = true;
  return response;
}

std::vector<DetailedJournalReceiver>
AS400Engine::listReceivers(const JournalInfo &journal) {
  std::vector<DetailedJournalReceiver> receivers;
  if (!StringUtils::isValidSystemName(journal.journalName) ||
      !StringUtils::isValidSystemName(journal.journalLibrary)) {
    throw RetrieveJournalException("Invalid journal name " +
                                   journal.qualifiedName());
  }

  AS400ODBCConnection *conn = connection();
  if (!conn) {
    throw RetrieveJournalException("No AS400 connection available for " +
                                   journal.qualifiedName());
  }

  std::string query =
      "SELECT JOURNAL_RECEIVER_NAME, JOURNAL_RECEIVER_LIBRARY, "
      "FIRST_SEQUENCE_NUMBER, LAST_SEQUENCE_NUMBER, STATUS, "
      "ATTACH_TIMESTAMP "
      "FROM QSYS2.JOURNAL_RECEIVER_INFO "
      "WHERE JOURNAL_LIBRARY = '" + StringUtils::toUpper(journal.journalLibrary) + "' "
      "AND JOURNAL_NAME = '" + StringUtils::toUpper(journal.journalName) + "' "
      "ORDER BY ATTACH_TIMESTAMP";

  for (const auto &row : executeQuery(conn->getDbc(), query)) {
    if (row.size() < 6)
      continue;
    DetailedJournalReceiver r;
    r.receiver = JournalReceiver{row[0], row[1]};
    r.firstSequence = toSequence(row[2]);
    r.lastSequence = std::max(r.firstSequence, toSequence(row[3]));
    r.status = row[4];
    r.attachTimestamp = row[5];
    receivers.push_back(std::move(r));
  }

  Logger::debug(LogCategory::JOURNAL, "AS400Engine::listReceivers",
                std::to_string(receivers.size()) + " receivers for " +
                    journal.qualifiedName());
  return receivers;
}

std::optional<FileFilter>
AS400Engine::lookupSystemName(const std::string &schema,
                              const std::string &table) {
  AS400ODBCConnection *conn = connection();
  if (!conn)
    return std::nullopt;

  std::string query =
      "SELECT SYSTEM_TABLE_SCHEMA, SYSTEM_TABLE_NAME "
      "FROM QSYS2.SYSTABLES "
      "WHERE TABLE_SCHEMA = '" + schema + "' "
      "AND TABLE_NAME = '" + table + "' "
      "FETCH FIRST 1 ROW ONLY";

  auto results = executeQuery(conn->getDbc(), query);
  if (results.empty() || results[0].size() < 2)
    return std::nullopt;
  return FileFilter{results[0][0], results[0][1]};
}

std::vector<FileFilter>
AS400Engine::shortIncludes(const std::string &schema,
                           const std::vector<std::string> &includeTables) {
  std::vector<FileFilter> filters;

  for (const auto &entry : includeTables) {
    std::string tableSchema = StringUtils::toUpper(schema);
    std::string table = StringUtils::toUpper(entry);
    size_t dot = table.find('.');
    if (dot != std::string::npos) {
      tableSchema = table.substr(0, dot);
      table = table.substr(dot + 1);
    }

    if (!StringUtils::isValidSqlIdentifier(tableSchema) ||
        !StringUtils::isValidSqlIdentifier(table)) {
      Logger::warning(LogCategory::CONFIG, "AS400Engine::shortIncludes",
                      "Ignoring invalid include entry: " + entry);
      continue;
    }

    std::string key = tableSchema + "." + table;
    auto cached = systemNameCache_.find(key);
    if (cached != systemNameCache_.end()) {
      filters.push_back(cached->second);
      continue;
    }

    std::optional<FileFilter> resolved = lookupSystemName(tableSchema, table);
    if (!resolved) {
      if (tableSchema.size() <= 10 && table.size() <= 10) {
        resolved = FileFilter{tableSchema, table};
      } else {
        Logger::warning(LogCategory::CONFIG, "AS400Engine::shortIncludes",
                        "Cannot resolve system name for " + key +
                            ", dropping it from the filter");
        continue;
      }
    }
    systemNameCache_[key] = *resolved;
    filters.push_back(*resolved);
  }
  return filters;
}
