#ifndef MOCK_JOURNAL_SERVICES_H
#define MOCK_JOURNAL_SERVICES_H

#include "journal/journal_retrieval_service.h"
#include "storage/offset_store.h"
#include <deque>
#include <map>
#include <vector>

class MockJournalInfoSource : public IJournalInfoSource {
public:
  std::vector<DetailedJournalReceiver> receivers;
  int calls = 0;

  std::vector<DetailedJournalReceiver>
  listReceivers(const JournalInfo &) override {
    ++calls;
    return receivers;
  }
};

// Replays queued responses and records every request it saw.
class MockRetrievalService : public IJournalRetrievalService {
public:
  std::deque<RetrievalResponse> responses;
  std::vector<RetrievalRequest> requests;

  RetrievalResponse retrieveEntries(const RetrievalRequest &request) override {
    requests.push_back(request);
    if (responses.empty()) {
      RetrievalResponse failed;
      failed.messages.push_back(
          JournalMessage{std::string("CPF9999"), "No response queued", ""});
      return failed;
    }
    RetrievalResponse response = responses.front();
    responses.pop_front();
    return response;
  }

  void queueData(std::vector<uint8_t> data) {
    RetrievalResponse response;
    response.success = true;
    response.data = std::move(data);
    responses.push_back(std::move(response));
  }

  void queueFailure(std::vector<JournalMessage> messages) {
    RetrievalResponse response;
    response.messages = std::move(messages);
    responses.push_back(std::move(response));
  }
};

class InMemoryOffsetStore : public IOffsetStore {
public:
  std::map<std::string, JournalPosition> offsets;
  int saves = 0;

  std::optional<JournalPosition> load(const std::string &key) override {
    auto it = offsets.find(key);
    if (it == offsets.end())
      return std::nullopt;
    return it->second;
  }

  void save(const std::string &key, const JournalPosition &position) override {
    ++saves;
    offsets[key] = position;
  }
};

#endif
