#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "recall_core/db/connection_pool.hpp"

#include <utility>

namespace recall_core {

std::unique_ptr<sqlite::database> open_keyed_connection(const ConnectionSettings &settings) {
  auto db = std::make_unique<sqlite::database>(settings.db_path);
  sqlite3 *handle = db->connection().get();
  if (!handle) {
    throw ConnectionPoolError("No native handle for " + settings.db_path);
  }

  const int rc = sqlite3_key(handle, settings.db_key.c_str(),
                             static_cast<int>(settings.db_key.length()));
  if (rc != SQLITE_OK) {
    throw ConnectionPoolError("Failed to key " + settings.db_path + ": " +
                              std::string(sqlite3_errmsg(handle)));
  }

  // A wrong key only shows up on the first read
  try {
    *db << "SELECT count(*) FROM sqlite_master;";
  } catch (const sqlite::sqlite_exception &e) {
    throw ConnectionPoolError("Database key rejected for " + settings.db_path + ": " + e.what());
  }

  *db << "PRAGMA journal_mode = WAL;";
  *db << "PRAGMA busy_timeout = " + std::to_string(settings.busy_timeout.count()) + ";";
  return db;
}

ConnectionPool::ConnectionPool(ConnectionSettings settings, int pool_size)
    : settings_(std::move(settings)) {
  if (pool_size <= 0) {
    throw ConnectionPoolError("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    idle_.push(open_keyed_connection(settings_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  const bool ready = cv_.wait_for(lock, settings_.acquire_timeout,
                                  [this] { return shutting_down_ || !idle_.empty(); });

  if (shutting_down_) {
    throw ConnectionPoolError("Connection pool is shut down");
  }
  if (!ready) {
    throw ConnectionPoolError("Timed out after " + std::to_string(settings_.acquire_timeout.count()) +
                              "ms waiting for a database connection");
  }

  auto conn = std::move(idle_.front());
  idle_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_ || !conn) {
      return;
    }
    idle_.push(std::move(conn));
  }
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    shutting_down_ = true;
    std::queue<std::unique_ptr<sqlite::database>>().swap(idle_);
  }
  cv_.notify_all();
}

std::size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return idle_.size();
}

}  // namespace recall_core
