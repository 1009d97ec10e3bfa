#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "recall_core/async/keyed_mutex.hpp"
#include "recall_core/db/vector_record_store.hpp"
#include "recall_core/llm/embedding_gateway.hpp"

namespace recall_core {

/*
Bounded per-user conversational history. Every user keeps at most
`history_capacity` turns; recording a new turn evicts the oldest ones in the
same transaction that inserts it.
*/
class ConversationMemoryService {
 public:
  struct TurnDTO {
    std::string text;
    std::string owner;
    std::chrono::system_clock::time_point timestamp;
    float distance = 0.0f;  // only meaningful for recall()
  };

  ConversationMemoryService(std::shared_ptr<VectorRecordStore> store,
                            std::shared_ptr<EmbeddingGateway> embeddings,
                            std::size_t history_capacity = 10);

  // Returns the number of older turns evicted to make room
  std::size_t record_turn(const std::string &user_id, const std::string &text);

  std::vector<TurnDTO> recall(const std::string &user_id, const std::string &query_text, int k);

  // Oldest first
  std::vector<TurnDTO> history(const std::string &user_id);

  std::size_t clear(const std::string &user_id);
  std::size_t clear_all();

  std::vector<std::string> list_users();

  std::size_t history_capacity() const { return history_capacity_; }

 private:
  static TurnDTO to_dto(ConversationTurn &&turn, float distance = 0.0f);

  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<EmbeddingGateway> embeddings_;
  std::size_t history_capacity_;
  async::KeyedMutex user_locks_;
};

}  // namespace recall_core
