#include "recall_core/services/retrieval_engine.hpp"

#include <iostream>
#include <stdexcept>

namespace recall_core {

RetrievalEngine::RetrievalEngine(std::shared_ptr<VectorRecordStore> store,
                                 std::shared_ptr<EmbeddingGateway> embeddings,
                                 EngineOptions options)
    : store_(store),
      embeddings_(embeddings),
      options_(options),
      memory_(store, embeddings, options.history_capacity),
      documents_(store, embeddings) {
  if (options_.default_top_k <= 0) {
    throw std::invalid_argument("default_top_k must be positive");
  }
  if (store_->dimension() != embeddings_->dimension()) {
    throw std::invalid_argument("Store dimension " + std::to_string(store_->dimension()) +
                                " does not match embedding dimension " +
                                std::to_string(embeddings_->dimension()));
  }
}

template <typename Fn>
auto RetrievalEngine::guarded(const std::string &operation, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const EmbeddingUnavailable &e) {
    std::cerr << "[engine] " << operation << ": embedding unavailable: " << e.what() << std::endl;
    throw RetrievalUnavailable(operation + ": " + e.what());
  } catch (const StoreUnavailable &e) {
    std::cerr << "[engine] " << operation << ": store unavailable: " << e.what() << std::endl;
    throw RetrievalUnavailable(operation + ": " + e.what());
  } catch (const DimensionMismatch &e) {
    std::cerr << "[engine] " << operation << ": " << e.what() << std::endl;
    throw RetrievalRejected(operation + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw RetrievalRejected(operation + ": " + e.what());
  } catch (const VectorStoreError &e) {
    std::cerr << "[engine] " << operation << ": store error: " << e.what() << std::endl;
    throw RetrievalError(operation + ": " + e.what());
  }
}

int RetrievalEngine::resolve_k(std::optional<int> k) const {
  if (!k) {
    return options_.default_top_k;
  }
  if (*k <= 0) {
    throw std::invalid_argument("k must be positive, got " + std::to_string(*k));
  }
  return *k;
}

void RetrievalEngine::record_turn(const std::string &user_id, const std::string &text) {
  guarded("record_turn", [&] { memory_.record_turn(user_id, text); });
}

std::vector<RetrievalEngine::TurnDTO> RetrievalEngine::recall(const std::string &user_id,
                                                              const std::string &query_text,
                                                              std::optional<int> k) {
  return guarded("recall", [&] { return memory_.recall(user_id, query_text, resolve_k(k)); });
}

std::vector<RetrievalEngine::TurnDTO> RetrievalEngine::history(const std::string &user_id) {
  return guarded("history", [&] { return memory_.history(user_id); });
}

std::size_t RetrievalEngine::clear_history(const std::string &user_id) {
  return guarded("clear_history", [&] { return memory_.clear(user_id); });
}

std::size_t RetrievalEngine::clear_all_history() {
  return guarded("clear_all_history", [&] { return memory_.clear_all(); });
}

std::vector<std::string> RetrievalEngine::list_users() {
  return guarded("list_users", [&] { return memory_.list_users(); });
}

std::size_t RetrievalEngine::ingest(const std::vector<FragmentInput> &fragments,
                                    const std::string &user_id,
                                    const std::string &source,
                                    const std::string &visibility) {
  return guarded("ingest", [&] {
    return documents_.ingest(fragments, user_id, source, visibility_from_string(visibility));
  });
}

std::vector<RetrievalEngine::FragmentDTO> RetrievalEngine::retrieve(
    const std::string &user_id, const std::string &query_text, std::optional<int> k) {
  return guarded("retrieve",
                 [&] { return documents_.retrieve(user_id, query_text, resolve_k(k)); });
}

std::vector<SourceEntry> RetrievalEngine::list_sources() {
  return guarded("list_sources", [&] { return documents_.list_sources(); });
}

std::size_t RetrievalEngine::purge_by_source(const std::string &source) {
  return guarded("purge_by_source", [&] { return documents_.purge_by_source(source); });
}

std::size_t RetrievalEngine::purge_by_source_and_user(const std::string &source,
                                                      const std::string &user_id) {
  return guarded("purge_by_source_and_user",
                 [&] { return documents_.purge_by_source_and_user(source, user_id); });
}

std::size_t RetrievalEngine::purge_by_user(const std::string &user_id) {
  return guarded("purge_by_user", [&] { return documents_.purge_by_user(user_id); });
}

std::size_t RetrievalEngine::purge_all() {
  return guarded("purge_all", [&] { return documents_.purge_all(); });
}

HealthStatus RetrievalEngine::health() {
  HealthStatus status;
  try {
    store_->ping();
    status.store_ok = true;
  } catch (const VectorStoreError &e) {
    status.store_error = e.what();
    std::cerr << "[engine] health: store check failed: " << e.what() << std::endl;
  }
  status.embedding_ok = embeddings_->is_available();
  return status;
}

}  // namespace recall_core
