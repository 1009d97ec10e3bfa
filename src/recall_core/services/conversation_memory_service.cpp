#include "recall_core/services/conversation_memory_service.hpp"

#include <iostream>
#include <stdexcept>

namespace recall_core {

namespace {

void require_user(const std::string &user_id) {
  if (user_id.empty()) {
    throw std::invalid_argument("User id cannot be empty");
  }
}

}  // namespace

ConversationMemoryService::ConversationMemoryService(std::shared_ptr<VectorRecordStore> store,
                                                     std::shared_ptr<EmbeddingGateway> embeddings,
                                                     std::size_t history_capacity)
    : store_(std::move(store)),
      embeddings_(std::move(embeddings)),
      history_capacity_(history_capacity) {
  if (!store_ || !embeddings_) {
    throw std::invalid_argument("ConversationMemoryService requires a store and a gateway");
  }
  if (history_capacity_ == 0) {
    throw std::invalid_argument("History capacity must be greater than 0");
  }
}

ConversationMemoryService::TurnDTO ConversationMemoryService::to_dto(ConversationTurn &&turn,
                                                                     float distance) {
  TurnDTO dto;
  dto.text = std::move(turn.text);
  dto.owner = std::move(turn.owner);
  dto.timestamp = turn.created_at;
  dto.distance = distance;
  return dto;
}

std::size_t ConversationMemoryService::record_turn(const std::string &user_id,
                                                   const std::string &text) {
  require_user(user_id);
  if (text.empty()) {
    throw std::invalid_argument("Turn text cannot be empty");
  }

  // Embed outside the lock: the model round trip is the slow part
  ConversationTurn turn;
  turn.owner = user_id;
  turn.text = text;
  turn.embedding = embeddings_->embed_one(text);

  auto guard = user_locks_.lock(user_id);
  const auto owned = RecordFilter::owner_is(user_id);

  auto session = store_->begin_write();
  const std::size_t current = session->count_where<ConversationTurn>(owned);
  std::size_t evicted = 0;
  if (current >= history_capacity_) {
    evicted = session->delete_oldest<ConversationTurn>(owned, current - history_capacity_ + 1);
  }
  session->insert(turn);
  session->commit();

  if (evicted > 0) {
    std::cout << "[memory] Evicted " << evicted << " turn(s) for user " << user_id << std::endl;
  }
  return evicted;
}

std::vector<ConversationMemoryService::TurnDTO> ConversationMemoryService::recall(
    const std::string &user_id, const std::string &query_text, int k) {
  require_user(user_id);
  if (query_text.empty()) {
    throw std::invalid_argument("Query text cannot be empty");
  }
  if (k <= 0) {
    throw std::invalid_argument("k must be positive");
  }

  std::vector<float> query = embeddings_->embed_one(query_text);
  auto matches =
      store_->query_nearest<ConversationTurn>(RecordFilter::owner_is(user_id), query, k);

  std::vector<TurnDTO> results;
  results.reserve(matches.size());
  for (auto &match : matches) {
    results.push_back(to_dto(std::move(match.record), match.distance));
  }
  return results;
}

std::vector<ConversationMemoryService::TurnDTO> ConversationMemoryService::history(
    const std::string &user_id) {
  require_user(user_id);
  auto turns = store_->select_where<ConversationTurn>(RecordFilter::owner_is(user_id));

  std::vector<TurnDTO> results;
  results.reserve(turns.size());
  for (auto &turn : turns) {
    results.push_back(to_dto(std::move(turn)));
  }
  return results;
}

std::size_t ConversationMemoryService::clear(const std::string &user_id) {
  require_user(user_id);
  auto guard = user_locks_.lock(user_id);
  return store_->delete_where<ConversationTurn>(RecordFilter::owner_is(user_id));
}

std::size_t ConversationMemoryService::clear_all() {
  std::size_t removed = store_->delete_where<ConversationTurn>(RecordFilter::all());
  std::cout << "[memory] Cleared " << removed << " turn(s) for all users" << std::endl;
  return removed;
}

std::vector<std::string> ConversationMemoryService::list_users() {
  return store_->distinct_owners<ConversationTurn>();
}

}  // namespace recall_core
