#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>

#include "recall_core/db/database_manager.hpp"

namespace recall_core {

// Borrows one connection from the DatabaseManager pool for the lifetime of the
// guard. Throws ConnectionPoolError when none can be acquired.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(&manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw ConnectionPoolError("Failed to acquire database connection: pool returned nothing");
    }
  }

  PooledConnection(PooledConnection &&other) noexcept
      : manager_(other.manager_), conn_(std::move(other.conn_)) {}

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;
  PooledConnection &operator=(PooledConnection &&) = delete;

  ~PooledConnection() {
    if (conn_) {
      manager_->return_connection(std::move(conn_));
    }
  }

  sqlite::database *operator->() const { return conn_.get(); }
  sqlite::database &operator*() const { return *conn_; }

 private:
  DatabaseManager *manager_;
  std::unique_ptr<sqlite::database> conn_;
};

}  // namespace recall_core
