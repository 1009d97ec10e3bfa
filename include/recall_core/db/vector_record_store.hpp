#pragma once
#include <sqlite_modern_cpp.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "recall_core/db/database_manager.hpp"
#include "recall_core/db/pooled_connection.hpp"
#include "recall_core/db/record_filter.hpp"
#include "recall_core/db/transaction.hpp"
#include "recall_core/types/vector_record.hpp"

namespace recall_core {

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A vector whose length disagrees with the store dimension; nothing was written.
class DimensionMismatch : public VectorStoreError {
 public:
  using VectorStoreError::VectorStoreError;
};

// The storage layer could not serve the request right now; safe to retry.
class StoreUnavailable : public VectorStoreError {
 public:
  using VectorStoreError::VectorStoreError;
};

template <typename Record>
struct RecordMatch {
  Record record;
  float distance = 0.0f;
};

struct SourceEntry {
  std::string source;
  std::string uploader;
};

/*
Persistent collection of embedded records, one table per record kind.
Every primitive is a template over the kind (ConversationTurn or
DocumentFragment); callers express scoping through a RecordFilter.

Ranking is exact cosine distance, ascending, with ties going to the earlier
record by (created_at, insertion sequence).
*/
class VectorRecordStore {
 public:
  class WriteSession;

  VectorRecordStore(DatabaseManager &db_manager, int dimension);

  VectorRecordStore(const VectorRecordStore &) = delete;
  VectorRecordStore &operator=(const VectorRecordStore &) = delete;
  VectorRecordStore(VectorRecordStore &&) = delete;
  VectorRecordStore &operator=(VectorRecordStore &&) = delete;

  int dimension() const { return dimension_; }

  // Assigns id, created_at and sequence when absent. Returns false (and
  // writes nothing) when a record with the same explicit id already exists.
  template <typename Record>
  bool insert(Record &record);

  template <typename Record>
  std::size_t delete_where(const RecordFilter &filter);

  template <typename Record>
  std::size_t count_where(const RecordFilter &filter);

  // Matching records in creation order
  template <typename Record>
  std::vector<Record> select_where(const RecordFilter &filter);

  template <typename Record>
  std::vector<RecordMatch<Record>> query_nearest(const RecordFilter &filter,
                                                 const std::vector<float> &query_vector,
                                                 int k);

  template <typename Record>
  std::vector<std::string> distinct_owners();

  std::vector<SourceEntry> distinct_sources();

  // Cheap round trip used by health checks
  void ping();

  // Opens an immediate transaction on a dedicated connection.
  std::unique_ptr<WriteSession> begin_write();

 private:
  void register_dimension();

  DatabaseManager &db_manager_;
  const int dimension_;
};

/*
One unit of work against the store. All calls share one connection and one
BEGIN IMMEDIATE transaction; destroying the session without commit() rolls
everything back.
*/
class VectorRecordStore::WriteSession {
 public:
  explicit WriteSession(VectorRecordStore &store);

  WriteSession(const WriteSession &) = delete;
  WriteSession &operator=(const WriteSession &) = delete;

  template <typename Record>
  std::size_t count_where(const RecordFilter &filter);

  template <typename Record>
  std::size_t delete_where(const RecordFilter &filter);

  // Removes the `count` earliest matching records by creation order
  template <typename Record>
  std::size_t delete_oldest(const RecordFilter &filter, std::size_t count);

  template <typename Record>
  bool insert(Record &record);

  void commit();

 private:
  VectorRecordStore &store_;
  PooledConnection conn_;
  Transaction tx_;
};

}  // namespace recall_core
