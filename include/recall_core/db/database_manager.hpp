#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "recall_core/db/connection_pool.hpp"

namespace recall_core {

// Process-wide owner of the encrypted database: creates the schema once,
// then hands out pooled connections until shutdown().
class DatabaseManager {
 public:
  static DatabaseManager& get_instance();

  // No-op when already initialized; call shutdown() first to reopen.
  void initialize(const std::filesystem::path& db_path,
                  const std::string& db_key,
                  int pool_size,
                  std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(5000),
                  std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  // Used by PooledConnection
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  bool is_initialized() const { return is_initialized_; }
  void shutdown();

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const ConnectionSettings& settings);

  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace recall_core
