#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "recall_core/services/conversation_memory_service.hpp"
#include "recall_core/services/document_retrieval_service.hpp"

namespace recall_core {

class RetrievalError : public std::exception {
 public:
  explicit RetrievalError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  virtual bool retryable() const { return false; }

 private:
  std::string message_;
};

// A dependency (embedding model or storage) is temporarily unavailable.
class RetrievalUnavailable : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
  bool retryable() const override { return true; }
};

// The request itself is unusable: bad input or a dimension mismatch.
class RetrievalRejected : public RetrievalError {
 public:
  using RetrievalError::RetrievalError;
};

struct EngineOptions {
  std::size_t history_capacity = 10;
  int default_top_k = 3;
};

struct HealthStatus {
  bool store_ok = false;
  bool embedding_ok = false;
  std::string store_error;

  bool healthy() const { return store_ok && embedding_ok; }
};

/*
Single entry point for request handlers. Wraps the conversational memory and
document retrieval managers and reports every failure as a RetrievalError.
Nothing is retried here; callers decide based on retryable().
*/
class RetrievalEngine {
 public:
  using TurnDTO = ConversationMemoryService::TurnDTO;
  using FragmentDTO = DocumentRetrievalService::FragmentDTO;

  RetrievalEngine(std::shared_ptr<VectorRecordStore> store,
                  std::shared_ptr<EmbeddingGateway> embeddings,
                  EngineOptions options = {});

  // Conversation memory
  void record_turn(const std::string &user_id, const std::string &text);
  std::vector<TurnDTO> recall(const std::string &user_id, const std::string &query_text,
                              std::optional<int> k = std::nullopt);
  std::vector<TurnDTO> history(const std::string &user_id);
  std::size_t clear_history(const std::string &user_id);
  std::size_t clear_all_history();
  std::vector<std::string> list_users();

  // Documents
  std::size_t ingest(const std::vector<FragmentInput> &fragments,
                     const std::string &user_id,
                     const std::string &source,
                     const std::string &visibility = "private");
  std::vector<FragmentDTO> retrieve(const std::string &user_id, const std::string &query_text,
                                    std::optional<int> k = std::nullopt);
  std::vector<SourceEntry> list_sources();
  std::size_t purge_by_source(const std::string &source);
  std::size_t purge_by_source_and_user(const std::string &source, const std::string &user_id);
  std::size_t purge_by_user(const std::string &user_id);
  std::size_t purge_all();

  HealthStatus health();

  const EngineOptions &options() const { return options_; }

 private:
  template <typename Fn>
  auto guarded(const std::string &operation, Fn &&fn) -> decltype(fn());

  int resolve_k(std::optional<int> k) const;

  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<EmbeddingGateway> embeddings_;
  EngineOptions options_;
  ConversationMemoryService memory_;
  DocumentRetrievalService documents_;
};

}  // namespace recall_core
