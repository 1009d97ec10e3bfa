#include "recall_core/db/vector_record_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

#include "recall_core/db/sqlite_error_utils.hpp"
#include "recall_core/db/text_codec.hpp"
#include "recall_core/util/uuid.hpp"

namespace recall_core {

namespace {

using Clock = std::chrono::system_clock;

template <typename Record>
struct RecordTable;

template <>
struct RecordTable<ConversationTurn> {
  static constexpr const char *name = "conversation_turns";
  static constexpr const char *columns = "seq, id, user_id, content, vector_blob, created_at";
};

template <>
struct RecordTable<DocumentFragment> {
  static constexpr const char *name = "document_fragments";
  static constexpr const char *columns =
      "seq, id, user_id, source, visibility, content, vector_blob, metadata_json, created_at";
};

constexpr const char *CREATION_ORDER = " ORDER BY created_at ASC, seq ASC";

long long to_micros(const Clock::time_point &tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

Clock::time_point from_micros(long long micros) {
  return Clock::time_point(
      std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

// Translates storage-layer failures into the store's error taxonomy.
template <typename Fn>
auto guard_storage(const std::string &operation, Fn &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const sqlite::sqlite_exception &e) {
    const std::string message = format_db_error(operation, e);
    if (is_transient(classify_sqlite_code(e.get_code()))) {
      throw StoreUnavailable(message);
    }
    throw VectorStoreError(message);
  } catch (const ConnectionPoolError &e) {
    throw StoreUnavailable(operation + " failed: " + e.what());
  } catch (const TextCodecError &e) {
    throw VectorStoreError(operation + " failed: " + e.what());
  } catch (const nlohmann::json::exception &e) {
    throw VectorStoreError(operation + " failed: unreadable metadata: " + e.what());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError(operation + " failed: ranking error: " + e.what());
  }
}

template <typename Record>
void check_filter(const RecordFilter &) {}

template <>
void check_filter<ConversationTurn>(const RecordFilter &filter) {
  if (filter.references(RecordField::Source) || filter.references(RecordField::Visibility)) {
    throw std::invalid_argument("Conversation turns have no source or visibility attribute");
  }
}

void check_dimension(const std::vector<float> &vector, int dimension, const std::string &context) {
  if (vector.size() != static_cast<size_t>(dimension)) {
    throw DimensionMismatch(context + ": vector dimension mismatch. Expected " +
                            std::to_string(dimension) + ", got " + std::to_string(vector.size()));
  }
}

std::vector<char> vector_to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob, int dimension,
                                  const std::string &record_id) {
  if (blob.size() != dimension * sizeof(float)) {
    throw DimensionMismatch("Stored record " + record_id + " holds " +
                            std::to_string(blob.size() / sizeof(float)) +
                            " dimensions, store is configured for " + std::to_string(dimension));
  }
  std::vector<float> vector(dimension);
  std::memcpy(vector.data(), blob.data(), blob.size());
  return vector;
}

// Returns true when created_at was assigned here rather than by the caller.
bool prepare_identity(VectorRecord &record) {
  if (record.id.empty()) {
    record.id = util::new_record_id();
  }
  const bool stamped = record.created_at == Clock::time_point{};
  if (stamped) {
    record.created_at = Clock::now();
  }
  // Keep the in-memory value identical to what the column can hold
  record.created_at = from_micros(to_micros(record.created_at));
  return stamped;
}

// Store-assigned timestamps never fall behind the newest stored record, so a
// wall clock stepping backwards cannot reorder creation.
std::string created_at_expression(bool stamped, const std::string &table) {
  if (!stamped) {
    return "?";
  }
  return "MAX(?, IFNULL((SELECT MAX(created_at) FROM " + table + "), 0))";
}

void finish_insert(sqlite::database &db, VectorRecord &record, bool stamped,
                   const std::string &table) {
  record.sequence = db.last_insert_rowid();
  if (stamped) {
    long long stored = 0;
    db << "SELECT created_at FROM " + table + " WHERE seq = ?"
       << static_cast<long long>(record.sequence) >>
        stored;
    record.created_at = from_micros(stored);
  }
}

Visibility read_visibility(const std::string &value, const std::string &record_id) {
  try {
    return visibility_from_string(value);
  } catch (const std::invalid_argument &e) {
    throw VectorStoreError("Stored record " + record_id + " has unreadable visibility: " +
                           e.what());
  }
}

template <typename Fn>
void for_each_row(sqlite::database &db, const std::string &sql,
                  const std::vector<std::string> &params, Fn &&fn) {
  auto stmt = db << sql;
  for (const auto &param : params) {
    stmt << param;
  }
  stmt >> std::forward<Fn>(fn);
}

std::size_t execute(sqlite::database &db, const std::string &sql,
                    const std::vector<std::string> &params) {
  auto stmt = db << sql;
  for (const auto &param : params) {
    stmt << param;
  }
  stmt.execute();
  return static_cast<std::size_t>(db.rows_modified());
}

// "seq IN (3, 7, 9)"; sequences are integers, so they are inlined.
std::string sequence_clause(const std::vector<std::int64_t> &sequences) {
  std::string clause = "seq IN (";
  for (size_t i = 0; i < sequences.size(); ++i) {
    if (i > 0) {
      clause += ", ";
    }
    clause += std::to_string(sequences[i]);
  }
  return clause + ")";
}

void read_records(sqlite::database &db, const std::string &where,
                  const std::vector<std::string> &params, int dimension,
                  std::vector<ConversationTurn> &out) {
  std::string sql = std::string("SELECT ") + RecordTable<ConversationTurn>::columns + " FROM " +
                    RecordTable<ConversationTurn>::name + " WHERE " + where + CREATION_ORDER;
  for_each_row(db, sql, params,
               [&](long long seq, std::string id, std::string user_id, std::string content,
                   std::vector<char> vector_blob, long long created_at) {
                 ConversationTurn turn;
                 turn.sequence = seq;
                 turn.embedding = blob_to_vector(vector_blob, dimension, id);
                 turn.id = std::move(id);
                 turn.owner = std::move(user_id);
                 turn.text = std::move(content);
                 turn.created_at = from_micros(created_at);
                 out.push_back(std::move(turn));
               });
}

void read_records(sqlite::database &db, const std::string &where,
                  const std::vector<std::string> &params, int dimension,
                  std::vector<DocumentFragment> &out) {
  std::string sql = std::string("SELECT ") + RecordTable<DocumentFragment>::columns + " FROM " +
                    RecordTable<DocumentFragment>::name + " WHERE " + where + CREATION_ORDER;
  for_each_row(db, sql, params,
               [&](long long seq, std::string id, std::string user_id, std::string source,
                   std::string visibility, std::vector<char> content,
                   std::vector<char> vector_blob, std::string metadata_json,
                   long long created_at) {
                 DocumentFragment fragment;
                 fragment.sequence = seq;
                 fragment.embedding = blob_to_vector(vector_blob, dimension, id);
                 fragment.visibility = read_visibility(visibility, id);
                 fragment.id = std::move(id);
                 fragment.owner = std::move(user_id);
                 fragment.source = std::move(source);
                 fragment.text = TextCodec::decode(content);
                 fragment.metadata = nlohmann::json::parse(metadata_json).get<Metadata>();
                 fragment.created_at = from_micros(created_at);
                 out.push_back(std::move(fragment));
               });
}

template <typename Record>
void read_records(sqlite::database &db, const RecordFilter &filter, int dimension,
                  std::vector<Record> &out) {
  std::vector<std::string> params;
  const std::string where = filter.to_sql(params);
  read_records(db, where, params, dimension, out);
}

// Ranking input: sequence and embedding only, in creation order.
struct Candidate {
  std::int64_t sequence = 0;
  std::vector<float> embedding;
};

template <typename Record>
std::vector<Candidate> read_candidates(sqlite::database &db, const RecordFilter &filter,
                                       int dimension) {
  std::vector<std::string> params;
  std::string sql = std::string("SELECT seq, id, vector_blob FROM ") + RecordTable<Record>::name +
                    " WHERE " + filter.to_sql(params) + CREATION_ORDER;
  std::vector<Candidate> candidates;
  for_each_row(db, sql, params,
               [&](long long seq, std::string id, std::vector<char> vector_blob) {
                 candidates.push_back({seq, blob_to_vector(vector_blob, dimension, id)});
               });
  return candidates;
}

bool insert_record(sqlite::database &db, ConversationTurn &turn, int dimension) {
  check_dimension(turn.embedding, dimension, "insert conversation turn");
  const std::string table = RecordTable<ConversationTurn>::name;
  const bool stamped = prepare_identity(turn);
  db << "INSERT OR IGNORE INTO " + table +
            " (id, user_id, content, vector_blob, created_at) VALUES (?, ?, ?, ?, " +
            created_at_expression(stamped, table) + ")"
     << turn.id << turn.owner << turn.text << vector_to_blob(turn.embedding)
     << to_micros(turn.created_at);
  if (db.rows_modified() == 0) {
    return false;
  }
  finish_insert(db, turn, stamped, table);
  return true;
}

bool insert_record(sqlite::database &db, DocumentFragment &fragment, int dimension) {
  check_dimension(fragment.embedding, dimension, "insert document fragment");
  // An empty blob binds as NULL, which the content column refuses
  if (fragment.text.empty()) {
    throw std::invalid_argument("Document fragment text cannot be empty");
  }
  const std::string table = RecordTable<DocumentFragment>::name;
  const bool stamped = prepare_identity(fragment);
  const std::string metadata_json = nlohmann::json(fragment.metadata).dump();
  db << "INSERT OR IGNORE INTO " + table +
            " (id, user_id, source, visibility, content, vector_blob, metadata_json, "
            "created_at) VALUES (?, ?, ?, ?, ?, ?, ?, " +
            created_at_expression(stamped, table) + ")"
     << fragment.id << fragment.owner << fragment.source << to_string(fragment.visibility)
     << TextCodec::encode(fragment.text) << vector_to_blob(fragment.embedding) << metadata_json
     << to_micros(fragment.created_at);
  if (db.rows_modified() == 0) {
    return false;
  }
  finish_insert(db, fragment, stamped, table);
  return true;
}

template <typename Record>
std::size_t count_in(sqlite::database &db, const RecordFilter &filter) {
  std::vector<std::string> params;
  std::string sql = std::string("SELECT count(*) FROM ") + RecordTable<Record>::name +
                    " WHERE " + filter.to_sql(params);
  long long count = 0;
  for_each_row(db, sql, params, [&](long long value) { count = value; });
  return static_cast<std::size_t>(count);
}

template <typename Record>
std::size_t delete_in(sqlite::database &db, const RecordFilter &filter) {
  std::vector<std::string> params;
  std::string sql =
      std::string("DELETE FROM ") + RecordTable<Record>::name + " WHERE " + filter.to_sql(params);
  return execute(db, sql, params);
}

template <typename Record>
std::size_t delete_oldest_in(sqlite::database &db, const RecordFilter &filter, std::size_t count) {
  if (count == 0) {
    return 0;
  }
  std::vector<std::string> params;
  const std::string table = RecordTable<Record>::name;
  std::string sql = "DELETE FROM " + table + " WHERE seq IN (SELECT seq FROM " + table +
                    " WHERE " + filter.to_sql(params) + CREATION_ORDER + " LIMIT " +
                    std::to_string(count) + ")";
  return execute(db, sql, params);
}

// Exhaustive inner-product search over L2-normalised copies, so similarity is
// exact cosine. Candidates arrive in creation order; their position is the
// tie-breaker.
std::vector<std::pair<std::size_t, float>> rank_by_cosine_distance(
    const std::vector<Candidate> &candidates, const std::vector<float> &query_vector,
    int dimension, int k) {
  const auto n = static_cast<faiss::idx_t>(candidates.size());

  std::vector<float> flat;
  flat.reserve(candidates.size() * dimension);
  for (const auto &candidate : candidates) {
    flat.insert(flat.end(), candidate.embedding.begin(), candidate.embedding.end());
  }
  faiss::fvec_renorm_L2(dimension, candidates.size(), flat.data());

  std::vector<float> query(query_vector);
  faiss::fvec_renorm_L2(dimension, 1, query.data());

  faiss::IndexFlatIP index(dimension);
  index.add(n, flat.data());

  std::vector<float> similarities(candidates.size());
  std::vector<faiss::idx_t> labels(candidates.size());
  index.search(1, query.data(), n, similarities.data(), labels.data());

  std::vector<std::pair<std::size_t, float>> ranked;
  ranked.reserve(candidates.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] < 0) {
      continue;
    }
    ranked.emplace_back(static_cast<std::size_t>(labels[i]), 1.0f - similarities[i]);
  }

  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.second != b.second) {
      return a.second < b.second;
    }
    return a.first < b.first;
  });

  if (ranked.size() > static_cast<size_t>(k)) {
    ranked.resize(k);
  }
  return ranked;
}

}  // namespace

VectorRecordStore::VectorRecordStore(DatabaseManager &db_manager, int dimension)
    : db_manager_(db_manager), dimension_(dimension) {
  if (dimension_ <= 0) {
    throw std::invalid_argument("Embedding dimension must be greater than 0");
  }
  register_dimension();
}

void VectorRecordStore::register_dimension() {
  guard_storage("register_dimension", [&] {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    std::optional<std::string> recorded;
    *conn << "SELECT value FROM store_info WHERE key = 'embedding_dimension'" >>
        [&](std::string value) { recorded = value; };

    if (!recorded) {
      *conn << "INSERT INTO store_info (key, value) VALUES ('embedding_dimension', ?)"
            << std::to_string(dimension_);
      std::cout << "Registered embedding dimension " << dimension_ << " for new store"
                << std::endl;
    } else if (*recorded != std::to_string(dimension_)) {
      throw DimensionMismatch("Store was created for embedding dimension " + *recorded +
                              " but is configured for " + std::to_string(dimension_));
    }
    tx.commit();
  });
}

template <typename Record>
bool VectorRecordStore::insert(Record &record) {
  return guard_storage("insert", [&] {
    PooledConnection conn(db_manager_);
    return insert_record(*conn, record, dimension_);
  });
}

template <typename Record>
std::size_t VectorRecordStore::delete_where(const RecordFilter &filter) {
  check_filter<Record>(filter);
  return guard_storage("delete_where", [&] {
    PooledConnection conn(db_manager_);
    return delete_in<Record>(*conn, filter);
  });
}

template <typename Record>
std::size_t VectorRecordStore::count_where(const RecordFilter &filter) {
  check_filter<Record>(filter);
  return guard_storage("count_where", [&] {
    PooledConnection conn(db_manager_);
    return count_in<Record>(*conn, filter);
  });
}

template <typename Record>
std::vector<Record> VectorRecordStore::select_where(const RecordFilter &filter) {
  check_filter<Record>(filter);
  return guard_storage("select_where", [&] {
    std::vector<Record> records;
    PooledConnection conn(db_manager_);
    read_records(*conn, filter, dimension_, records);
    return records;
  });
}

template <typename Record>
std::vector<RecordMatch<Record>> VectorRecordStore::query_nearest(
    const RecordFilter &filter, const std::vector<float> &query_vector, int k) {
  check_filter<Record>(filter);
  check_dimension(query_vector, dimension_, "query_nearest");
  if (k <= 0) {
    return {};
  }

  return guard_storage("query_nearest", [&] {
    std::vector<RecordMatch<Record>> matches;
    PooledConnection conn(db_manager_);
    // Ranking and hydration read one snapshot
    Transaction snapshot(*conn, TransactionMode::Deferred);

    // Only embeddings are read for ranking; text and metadata are decoded for
    // the top k alone.
    std::vector<Candidate> candidates = read_candidates<Record>(*conn, filter, dimension_);
    if (candidates.empty()) {
      return matches;
    }
    auto ranked = rank_by_cosine_distance(candidates, query_vector, dimension_, k);

    std::vector<std::int64_t> winners;
    winners.reserve(ranked.size());
    for (const auto &entry : ranked) {
      winners.push_back(candidates[entry.first].sequence);
    }
    std::vector<Record> records;
    read_records(*conn, sequence_clause(winners), {}, dimension_, records);
    snapshot.commit();

    matches.reserve(ranked.size());
    for (const auto &[position, distance] : ranked) {
      const std::int64_t sequence = candidates[position].sequence;
      auto it = std::find_if(records.begin(), records.end(),
                             [&](const Record &r) { return r.sequence == sequence; });
      if (it == records.end()) {
        throw VectorStoreError("Ranked record vanished from snapshot (seq " +
                               std::to_string(sequence) + ")");
      }
      matches.push_back({std::move(*it), distance});
    }
    return matches;
  });
}

template <typename Record>
std::vector<std::string> VectorRecordStore::distinct_owners() {
  return guard_storage("distinct_owners", [&] {
    std::vector<std::string> owners;
    PooledConnection conn(db_manager_);
    *conn << std::string("SELECT DISTINCT user_id FROM ") + RecordTable<Record>::name +
                 " ORDER BY user_id" >>
        [&](std::string user_id) { owners.push_back(std::move(user_id)); };
    return owners;
  });
}

std::vector<SourceEntry> VectorRecordStore::distinct_sources() {
  return guard_storage("distinct_sources", [&] {
    std::vector<SourceEntry> sources;
    PooledConnection conn(db_manager_);
    *conn << "SELECT DISTINCT source, user_id FROM document_fragments ORDER BY source, user_id" >>
        [&](std::string source, std::string user_id) {
          sources.push_back({std::move(source), std::move(user_id)});
        };
    return sources;
  });
}

void VectorRecordStore::ping() {
  guard_storage("ping", [&] {
    PooledConnection conn(db_manager_);
    int count = 0;
    *conn << "SELECT count(*) FROM store_info" >> count;
  });
}

std::unique_ptr<VectorRecordStore::WriteSession> VectorRecordStore::begin_write() {
  return guard_storage("begin_write", [&] { return std::make_unique<WriteSession>(*this); });
}

VectorRecordStore::WriteSession::WriteSession(VectorRecordStore &store)
    : store_(store), conn_(store.db_manager_), tx_(*conn_, TransactionMode::Immediate) {}

template <typename Record>
std::size_t VectorRecordStore::WriteSession::count_where(const RecordFilter &filter) {
  check_filter<Record>(filter);
  return guard_storage("session.count_where", [&] { return count_in<Record>(*conn_, filter); });
}

template <typename Record>
std::size_t VectorRecordStore::WriteSession::delete_where(const RecordFilter &filter) {
  check_filter<Record>(filter);
  return guard_storage("session.delete_where", [&] { return delete_in<Record>(*conn_, filter); });
}

template <typename Record>
std::size_t VectorRecordStore::WriteSession::delete_oldest(const RecordFilter &filter,
                                                           std::size_t count) {
  check_filter<Record>(filter);
  return guard_storage("session.delete_oldest",
                       [&] { return delete_oldest_in<Record>(*conn_, filter, count); });
}

template <typename Record>
bool VectorRecordStore::WriteSession::insert(Record &record) {
  return guard_storage("session.insert",
                       [&] { return insert_record(*conn_, record, store_.dimension_); });
}

void VectorRecordStore::WriteSession::commit() {
  guard_storage("session.commit", [&] { tx_.commit(); });
}

template bool VectorRecordStore::insert<ConversationTurn>(ConversationTurn &);
template bool VectorRecordStore::insert<DocumentFragment>(DocumentFragment &);
template std::size_t VectorRecordStore::delete_where<ConversationTurn>(const RecordFilter &);
template std::size_t VectorRecordStore::delete_where<DocumentFragment>(const RecordFilter &);
template std::size_t VectorRecordStore::count_where<ConversationTurn>(const RecordFilter &);
template std::size_t VectorRecordStore::count_where<DocumentFragment>(const RecordFilter &);
template std::vector<ConversationTurn> VectorRecordStore::select_where<ConversationTurn>(
    const RecordFilter &);
template std::vector<DocumentFragment> VectorRecordStore::select_where<DocumentFragment>(
    const RecordFilter &);
template std::vector<RecordMatch<ConversationTurn>>
VectorRecordStore::query_nearest<ConversationTurn>(const RecordFilter &,
                                                   const std::vector<float> &, int);
template std::vector<RecordMatch<DocumentFragment>>
VectorRecordStore::query_nearest<DocumentFragment>(const RecordFilter &,
                                                   const std::vector<float> &, int);
template std::vector<std::string> VectorRecordStore::distinct_owners<ConversationTurn>();
template std::vector<std::string> VectorRecordStore::distinct_owners<DocumentFragment>();

template std::size_t VectorRecordStore::WriteSession::count_where<ConversationTurn>(
    const RecordFilter &);
template std::size_t VectorRecordStore::WriteSession::count_where<DocumentFragment>(
    const RecordFilter &);
template std::size_t VectorRecordStore::WriteSession::delete_where<ConversationTurn>(
    const RecordFilter &);
template std::size_t VectorRecordStore::WriteSession::delete_where<DocumentFragment>(
    const RecordFilter &);
template std::size_t VectorRecordStore::WriteSession::delete_oldest<ConversationTurn>(
    const RecordFilter &, std::size_t);
template std::size_t VectorRecordStore::WriteSession::delete_oldest<DocumentFragment>(
    const RecordFilter &, std::size_t);
template bool VectorRecordStore::WriteSession::insert<ConversationTurn>(ConversationTurn &);
template bool VectorRecordStore::WriteSession::insert<DocumentFragment>(DocumentFragment &);

}  // namespace recall_core
