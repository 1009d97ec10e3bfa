#include "recall_core/services/document_retrieval_service.hpp"

#include <iostream>
#include <stdexcept>

#include "recall_core/db/text_codec.hpp"

namespace recall_core {

namespace {

void require_non_empty(const std::string &value, const char *what) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " cannot be empty");
  }
}

}  // namespace

DocumentRetrievalService::DocumentRetrievalService(std::shared_ptr<VectorRecordStore> store,
                                                   std::shared_ptr<EmbeddingGateway> embeddings)
    : store_(std::move(store)), embeddings_(std::move(embeddings)) {
  if (!store_ || !embeddings_) {
    throw std::invalid_argument("DocumentRetrievalService requires a store and a gateway");
  }
}

RecordFilter DocumentRetrievalService::visible_to(const std::string &user_id) {
  return RecordFilter::owner_is(user_id) || RecordFilter::visibility_is(Visibility::Shared);
}

// Length prefix keeps ("ab", "c") and ("a", "bc") apart
std::string DocumentRetrievalService::ingest_key(const std::string &source,
                                                 const std::string &user_id) {
  return std::to_string(source.size()) + ":" + source + user_id;
}

std::size_t DocumentRetrievalService::ingest(const std::vector<FragmentInput> &fragments,
                                             const std::string &user_id,
                                             const std::string &source,
                                             Visibility visibility) {
  require_non_empty(user_id, "User id");
  require_non_empty(source, "Source");
  if (fragments.empty()) {
    return 0;
  }

  std::vector<std::string> texts;
  texts.reserve(fragments.size());
  for (const auto &fragment : fragments) {
    require_non_empty(fragment.text, "Fragment text");
    if (fragment.text.size() > TextCodec::MAX_DECODED_BYTES) {
      throw std::invalid_argument("Fragment text of " + std::to_string(fragment.text.size()) +
                                  " bytes exceeds the limit of " +
                                  std::to_string(TextCodec::MAX_DECODED_BYTES) + " bytes");
    }
    texts.push_back(fragment.text);
  }

  auto guard = ingest_locks_.lock(ingest_key(source, user_id));

  // Nothing is written unless every fragment has an embedding
  auto vectors = embeddings_->embed_many(texts);

  auto session = store_->begin_write();
  std::size_t inserted = 0;
  for (size_t i = 0; i < fragments.size(); ++i) {
    DocumentFragment record;
    record.owner = user_id;
    record.source = source;
    record.visibility = visibility;
    record.text = fragments[i].text;
    record.metadata = fragments[i].metadata;
    record.embedding = std::move(vectors[i]);
    if (session->insert(record)) {
      ++inserted;
    }
  }
  session->commit();

  std::cout << "[documents] Ingested " << inserted << " fragment(s) from '" << source
            << "' for user " << user_id << " (" << to_string(visibility) << ")" << std::endl;
  return inserted;
}

std::vector<DocumentRetrievalService::FragmentDTO> DocumentRetrievalService::retrieve(
    const std::string &user_id, const std::string &query_text, int k) {
  require_non_empty(user_id, "User id");
  require_non_empty(query_text, "Query text");
  if (k <= 0) {
    throw std::invalid_argument("k must be positive");
  }

  std::vector<float> query = embeddings_->embed_one(query_text);
  const RecordFilter visible = visible_to(user_id);
  auto matches = store_->query_nearest<DocumentFragment>(visible, query, k);

  std::vector<FragmentDTO> results;
  results.reserve(matches.size());
  for (auto &match : matches) {
    if (!visible.matches(match.record)) {
      throw VectorStoreError("Store returned fragment " + match.record.id +
                             " outside the visibility scope of user " + user_id);
    }
    FragmentDTO dto;
    dto.text = std::move(match.record.text);
    dto.owner = std::move(match.record.owner);
    dto.source = std::move(match.record.source);
    dto.visibility = match.record.visibility;
    dto.metadata = std::move(match.record.metadata);
    dto.distance = match.distance;
    results.push_back(std::move(dto));
  }
  return results;
}

std::vector<SourceEntry> DocumentRetrievalService::list_sources() {
  return store_->distinct_sources();
}

std::size_t DocumentRetrievalService::purge_by_source(const std::string &source) {
  require_non_empty(source, "Source");
  return store_->delete_where<DocumentFragment>(RecordFilter::source_is(source));
}

std::size_t DocumentRetrievalService::purge_by_source_and_user(const std::string &source,
                                                               const std::string &user_id) {
  require_non_empty(source, "Source");
  require_non_empty(user_id, "User id");
  return store_->delete_where<DocumentFragment>(RecordFilter::source_is(source) &&
                                                RecordFilter::owner_is(user_id));
}

std::size_t DocumentRetrievalService::purge_by_user(const std::string &user_id) {
  require_non_empty(user_id, "User id");
  return store_->delete_where<DocumentFragment>(RecordFilter::owner_is(user_id));
}

std::size_t DocumentRetrievalService::purge_all() {
  std::size_t removed = store_->delete_where<DocumentFragment>(RecordFilter::all());
  std::cout << "[documents] Purged " << removed << " fragment(s)" << std::endl;
  return removed;
}

}  // namespace recall_core
