#pragma once

#include <sqlite_modern_cpp.h>

namespace recall_core {

enum class TransactionMode { Deferred, Immediate };

/*
Scoped transaction on one connection. Immediate mode takes the write lock up
front so a busy database fails at BEGIN instead of midway through the work.
Anything not committed is rolled back when the guard goes away; a failed
COMMIT leaves the transaction open for that rollback.
*/
class Transaction {
 public:
  explicit Transaction(sqlite::database &db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &) {
      // SQLite already rolled back on its own (e.g. after SQLITE_FULL)
    }
  }

 private:
  sqlite::database &db_;
  bool open_ = false;
};

}  // namespace recall_core
