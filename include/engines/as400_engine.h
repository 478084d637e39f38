#ifndef AS400_ENGINE_H
#define AS400_ENGINE_H

#include "core/logger.h"
#include "journal/journal_retrieval_service.h"
#include "journal/retrieval_criteria.h"
#include <functional>
#include <memory>
#include <optional>
#include <sql.h>
#include <sqlext.h>
#include <string>
#include <unordered_map>
#include <vector>

class AS400ODBCConnection {
  SQLHENV env_{SQL_NULL_HANDLE};
  SQLHDBC dbc_{SQL_NULL_HANDLE};
  bool valid_{false};

public:
  explicit AS400ODBCConnection(const std::string &connectionString);
  ~AS400ODBCConnection();

  AS400ODBCConnection(const AS400ODBCConnection &) = delete;
  AS400ODBCConnection &operator=(const AS400ODBCConnection &) = delete;

  AS400ODBCConnection(AS400ODBCConnection &&other) noexcept;
  AS400ODBCConnection &operator=(AS400ODBCConnection &&other) noexcept;

  SQLHDBC getDbc() const { return dbc_; }
  bool isValid() const { return valid_; }
  // Asks the driver whether the server side of the connection is gone.
  bool isAlive() const;
};

// Journal access over IBM i Access ODBC. QjoRetrieveJournalEntries is
// reached through an external SQL procedure registered over
// QSYS/QJOURNAL, e.g.
//
//   CREATE PROCEDURE QGPL.RTVJRNE (
//     OUT RCVVAR VARBINARY(16773104), IN RCVLEN INTEGER,
//     IN JRNNAME CHAR(20), IN FMTNAME CHAR(8),
//     IN JRNSEL VARBINARY(32000), INOUT ERRCODE BINARY(528))
//   EXTERNAL NAME 'QSYS/QJOURNAL(QjoRetrieveJournalEntries)'
//   LANGUAGE C PARAMETER STYLE GENERAL
class AS400Engine : public IJournalRetrievalService, public IJournalInfoSource {
  std::string connectionString_;
  std::string retrieveProcedure_;
  std::unique_ptr<AS400ODBCConnection> connection_;
  std::unordered_map<std::string, FileFilter> systemNameCache_;

  std::unique_ptr<AS400ODBCConnection> createConnection();
  AS400ODBCConnection *connection();
  std::vector<std::vector<std::string>> executeQuery(SQLHDBC dbc,
                                                     const std::string &query);
  std::optional<FileFilter> lookupSystemName(const std::string &schema,
                                             const std::string &table);

public:
  static constexpr size_t ERROR_CODE_SIZE = 528;
  static constexpr const char *DEFAULT_RETRIEVE_PROCEDURE = "QGPL.RTVJRNE";

  explicit AS400Engine(std::string connectionString,
                       std::string retrieveProcedure = DEFAULT_RETRIEVE_PROCEDURE);

  RetrievalResponse retrieveEntries(const RetrievalRequest &request) override;
  std::vector<DetailedJournalReceiver>
  listReceivers(const JournalInfo &journal) override;

  // Maps SQL long names to the 10 character system names the journal
  // filter needs. Entries may be TABLE or SCHEMA.TABLE.
  std::vector<FileFilter>
  shortIncludes(const std::string &schema,
                const std::vector<std::string> &includeTables);

  // ERRC0100 with bytes provided filled in.
  static std::vector<uint8_t> makeErrorCode();
  // Empty when the error code reports no exception.
  static std::vector<JournalMessage>
  parseErrorCode(const std::vector<uint8_t> &errorCode);
  // First CPF/CPD/MCH style identifier found in a diagnostic text.
  static std::optional<std::string> extractMessageId(const std::string &text);

  // One SQLGetData call into (buffer, bufferLength, indicator).
  using CharChunkReader =
      std::function<SQLRETURN(char *, SQLLEN, SQLLEN *)>;
  // Reads a character cell chunk by chunk so long values are not cut at
  // the buffer size. Returns "NULL" for SQL NULL or a failed read.
  static std::string readCharCell(const CharChunkReader &read);
};

#endif
