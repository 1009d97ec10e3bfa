#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>

namespace recall_core {

class ConnectionPoolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ConnectionSettings {
  std::string db_path;
  std::string db_key;
  // How long a borrower waits for an idle connection
  std::chrono::milliseconds acquire_timeout{5000};
  // How long SQLite itself retries a locked database
  std::chrono::milliseconds busy_timeout{5000};
};

// Opens one SQLCipher connection, applies the key and verifies it by reading
// sqlite_master. Throws ConnectionPoolError when the key is rejected.
std::unique_ptr<sqlite::database> open_keyed_connection(const ConnectionSettings &settings);

/*
Fixed set of keyed connections shared by every store operation. Borrowers
wait at most acquire_timeout; after shutdown() every borrow fails and
returned connections are closed instead of requeued.
*/
class ConnectionPool {
 public:
  ConnectionPool(ConnectionSettings settings, int pool_size);

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  std::size_t idle_count() const;

 private:
  const ConnectionSettings settings_;
  std::queue<std::unique_ptr<sqlite::database>> idle_;
  bool shutting_down_ = false;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace recall_core
