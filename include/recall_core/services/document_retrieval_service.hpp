#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "recall_core/async/keyed_mutex.hpp"
#include "recall_core/db/vector_record_store.hpp"
#include "recall_core/llm/embedding_gateway.hpp"

namespace recall_core {

struct FragmentInput {
  std::string text;
  Metadata metadata;
};

class DocumentRetrievalService {
 public:
  struct FragmentDTO {
    std::string text;
    std::string owner;
    std::string source;
    Visibility visibility = Visibility::Private;
    Metadata metadata;
    float distance = 0.0f;
  };

  DocumentRetrievalService(std::shared_ptr<VectorRecordStore> store,
                           std::shared_ptr<EmbeddingGateway> embeddings);

  // All fragments of one batch are embedded in a single call and written in a
  // single transaction. Returns the number of fragments stored.
  std::size_t ingest(const std::vector<FragmentInput> &fragments,
                     const std::string &user_id,
                     const std::string &source,
                     Visibility visibility);

  // One ranked list over the caller's own fragments and every shared fragment.
  std::vector<FragmentDTO> retrieve(const std::string &user_id, const std::string &query_text,
                                    int k);

  std::vector<SourceEntry> list_sources();

  std::size_t purge_by_source(const std::string &source);
  std::size_t purge_by_source_and_user(const std::string &source, const std::string &user_id);
  std::size_t purge_by_user(const std::string &user_id);
  std::size_t purge_all();

 private:
  static RecordFilter visible_to(const std::string &user_id);
  static std::string ingest_key(const std::string &source, const std::string &user_id);

  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<EmbeddingGateway> embeddings_;
  async::KeyedMutex ingest_locks_;
};

}  // namespace recall_core
