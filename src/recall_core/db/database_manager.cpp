#include "recall_core/db/database_manager.hpp"

#include <iostream>
#include <stdexcept>

namespace recall_core {

DatabaseManager& DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size,
                                 std::chrono::milliseconds acquire_timeout,
                                 std::chrono::milliseconds busy_timeout) {
  if (is_initialized_) {
    return;
  }
  if (db_key.empty()) {
    throw std::invalid_argument("DatabaseManager requires a non-empty database key");
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  ConnectionSettings settings;
  settings.db_path = db_path.string();
  settings.db_key = db_key;
  settings.acquire_timeout = acquire_timeout;
  settings.busy_timeout = busy_timeout;

  // Schema first, on its own connection, so pooled connections never race DDL
  setup_schema(settings);
  pool_ = std::make_unique<ConnectionPool>(std::move(settings), pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw ConnectionPoolError("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const ConnectionSettings& settings) {
  auto conn = open_keyed_connection(settings);
  sqlite::database& db = *conn;

  db << R"(
      CREATE TABLE IF NOT EXISTS store_info (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";

  // seq doubles as the insertion sequence used to break timestamp ties
  db << R"(
      CREATE TABLE IF NOT EXISTS conversation_turns (
          seq INTEGER PRIMARY KEY AUTOINCREMENT,
          id TEXT UNIQUE NOT NULL,
          user_id TEXT NOT NULL,
          content TEXT NOT NULL,
          vector_blob BLOB NOT NULL,
          created_at INTEGER NOT NULL
      )
    )";
  db << R"(
      CREATE INDEX IF NOT EXISTS idx_turns_user_created
      ON conversation_turns(user_id, created_at, seq)
    )";
  // Serves MAX(created_at) when the store stamps a new record
  db << "CREATE INDEX IF NOT EXISTS idx_turns_created ON conversation_turns(created_at)";

  db << R"(
      CREATE TABLE IF NOT EXISTS document_fragments (
          seq INTEGER PRIMARY KEY AUTOINCREMENT,
          id TEXT UNIQUE NOT NULL,
          user_id TEXT NOT NULL,
          source TEXT NOT NULL,
          visibility TEXT NOT NULL,
          content BLOB NOT NULL,
          vector_blob BLOB NOT NULL,
          metadata_json TEXT NOT NULL DEFAULT '{}',
          created_at INTEGER NOT NULL
      )
    )";
  db << "CREATE INDEX IF NOT EXISTS idx_fragments_user ON document_fragments(user_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_fragments_source ON document_fragments(source, user_id)";
  db << "CREATE INDEX IF NOT EXISTS idx_fragments_visibility ON document_fragments(visibility)";
  db << "CREATE INDEX IF NOT EXISTS idx_fragments_created ON document_fragments(created_at)";

  std::cout << "Schema ready at " << settings.db_path << std::endl;
}

}  // namespace recall_core
