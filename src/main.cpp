#include "core/journal_sync_config.h"
#include "core/logger.h"
#include "engines/as400_engine.h"
#include "journal/journal_poller.h"
#include "journal/journal_retriever.h"
#include "storage/offset_store.h"
#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Logger shutdown failed: " << e.what() << std::endl;
  }
}

bool handleEntry(JournalRetriever &retriever, const RetrievalSession &session,
                 const RawEntryDataDecoder &decoder) {
  const EntryHeader &entry = *session.entryHeader();
  if (!isRequiredEntry(entry.code(), entry.type())) {
    Logger::debug(LogCategory::JOURNAL, "main",
                  "Ignoring " + entry.journalCode + "/" + entry.entryType +
                      " at " + std::to_string(entry.sequenceNumber));
    return true;
  }

  std::vector<uint8_t> data = retriever.decode(session, decoder);
  Logger::info(LogCategory::JOURNAL, "main",
               entry.journalCode + "/" + entry.entryType + " " +
                   entry.objectLibrary() + "/" + entry.objectName() +
                   " sequence " + std::to_string(entry.sequenceNumber) +
                   " rrn " + std::to_string(entry.countOrRrn) + " " +
                   std::to_string(data.size()) + " bytes");
  return true;
}

int runJournalSync() {
  RetrieveConfig retrieveConfig = JournalSyncConfig::toRetrieveConfig();
  Logger::info(LogCategory::SYSTEM, "main",
               "journal_sync started for " +
                   retrieveConfig.journal.qualifiedName() + " (offsets: " +
                   JournalSyncConfig::getPostgresConnectionStringForLogging() +
                   ")");

  AS400Engine engine(JournalSyncConfig::getAS400ConnectionString(),
                     JournalSyncConfig::getRetrieveProcedure());
  PostgresOffsetStore offsetStore(
      JournalSyncConfig::getPostgresConnectionString());

  if (retrieveConfig.filtering) {
    retrieveConfig.includeFiles =
        engine.shortIncludes(JournalSyncConfig::getIncludeSchema(),
                             JournalSyncConfig::getIncludeTables());
    Logger::info(LogCategory::CONFIG, "main",
                 "Filtering on " +
                     std::to_string(retrieveConfig.includeFiles.size()) +
                     " files");
  }

  JournalRetriever retriever(retrieveConfig, engine, engine);
  JournalPoller poller(
      retriever, offsetStore, offsetKey(retrieveConfig.journal),
      std::chrono::milliseconds(JournalSyncConfig::getPollIntervalMs()));
  RawEntryDataDecoder decoder;

  std::atomic<bool> finished{false};
  std::exception_ptr failure;
  std::thread worker([&]() {
    try {
      poller.run([&](JournalRetriever &r, const RetrievalSession &s) {
        return handleEntry(r, s, decoder);
      });
    } catch (const RetrievalInterruptedException &e) {
      Logger::info(LogCategory::SYSTEM, "main", e.what());
    } catch (...) {
      failure = std::current_exception();
    }
    finished.store(true);
  });

  while (!finished.load() && !g_shutdownRequested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (g_shutdownRequested.load()) {
    Logger::info(LogCategory::SYSTEM, "main", "Shutdown requested");
  }
  poller.stop();
  worker.join();

  if (failure) {
    try {
      std::rethrow_exception(failure);
    } catch (const InvalidPositionException &e) {
      Logger::critical(LogCategory::JOURNAL, "main",
                       "Stored position is no longer valid: " +
                           std::string(e.what()));
      return EXIT_CRITICAL_ERROR;
    } catch (const InvalidJournalFilterException &e) {
      Logger::critical(LogCategory::CONFIG, "main",
                       "Journal filter is invalid: " + std::string(e.what()));
      return EXIT_CONFIG_ERROR;
    } catch (const RetrieveJournalException &e) {
      Logger::error(LogCategory::JOURNAL, "main",
                    "Journal retrieval failed: " + std::string(e.what()));
      return EXIT_EXECUTION_ERROR;
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Exception during journal_sync execution: " +
                        std::string(e.what()));
      std::cerr << "Execution error: " << e.what() << std::endl;
      return EXIT_EXECUTION_ERROR;
    }
  }
  Logger::info(LogCategory::SYSTEM, "main",
               "journal_sync stopped at " + poller.position().toString());
  return EXIT_SUCCESS_CODE;
}
} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = argc > 1 ? argv[1] : "config.json";

  try {
    JournalSyncConfig::loadFromFile(configPath);
    JournalSyncConfig::validate();
  } catch (const std::invalid_argument &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  Logger::initialize(JournalSyncConfig::getPostgresConnectionString(),
                     JournalSyncConfig::getLogFile());
  if (!Logger::setLogLevel(JournalSyncConfig::getLogLevel())) {
    Logger::warning(LogCategory::CONFIG, "main",
                    "Unknown log level '" + JournalSyncConfig::getLogLevel() +
                        "', keeping " + toString(Logger::getCurrentLogLevel()));
  }

  if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
    std::cerr << "Error: Failed to register SIGINT handler" << std::endl;
    cleanupLogger();
    return EXIT_SIGNAL_ERROR;
  }

  if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    std::cerr << "Error: Failed to register SIGTERM handler" << std::endl;
    cleanupLogger();
    return EXIT_SIGNAL_ERROR;
  }

  int exitCode = EXIT_SUCCESS_CODE;
  try {
    exitCode = runJournalSync();
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     "Startup failed: " + std::string(e.what()));
    std::cerr << "Startup error: " << e.what() << std::endl;
    exitCode = EXIT_CRITICAL_ERROR;
  }

  cleanupLogger();
  return exitCode;
}
