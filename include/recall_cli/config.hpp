#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace recall_cli {

class Config {
 public:
  std::string metadata_db_path;
  std::string db_key;
  int pool_size;
  int pool_acquire_timeout_ms;
  int busy_timeout_ms;

  // Embedding model
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_timeout_ms;

  // Retrieval behaviour
  int history_capacity;
  int default_top_k;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests).
  // RECALL_DB_KEY, when set, takes precedence over db_key.
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config root must be a JSON object");
    }

    Config config;
    config.metadata_db_path = read_string(json_config, "metadata_db_path", "./data/recall.db");
    config.db_key = read_string(json_config, "db_key", "");
    config.pool_size = read_int(json_config, "pool_size", 4);
    config.pool_acquire_timeout_ms = read_int(json_config, "pool_acquire_timeout_ms", 5000);
    config.busy_timeout_ms = read_int(json_config, "busy_timeout_ms", 5000);

    config.ollama_url = read_string(json_config, "ollama_url", "http://localhost:11434");
    config.embedding_model = read_string(json_config, "embedding_model", "mxbai-embed-large");
    config.embedding_dimension = read_int(json_config, "embedding_dimension", 1024);
    config.embedding_timeout_ms = read_int(json_config, "embedding_timeout_ms", 30000);

    config.history_capacity = read_int(json_config, "history_capacity", 10);
    config.default_top_k = read_int(json_config, "default_top_k", 3);

    const char* env_key = std::getenv("RECALL_DB_KEY");
    if (env_key && *env_key) {
      config.db_key = env_key;
    }

    config.validate();
    return config;
  }

 private:
  static std::string read_string(const nlohmann::json& json_config, const char* key,
                                 const std::string& fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    if (!json_config.at(key).is_string()) {
      throw std::runtime_error(std::string(key) + " must be a string");
    }
    return json_config.at(key).get<std::string>();
  }

  static int read_int(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    if (!json_config.at(key).is_number_integer()) {
      throw std::runtime_error(std::string(key) + " must be an integer");
    }
    return json_config.at(key).get<int>();
  }

  void validate() const {
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (db_key.empty()) {
      throw std::runtime_error("db_key cannot be empty (set it in the config or RECALL_DB_KEY)");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
    if (pool_acquire_timeout_ms <= 0) {
      throw std::runtime_error("pool_acquire_timeout_ms must be greater than 0");
    }
    if (busy_timeout_ms < 0) {
      throw std::runtime_error("busy_timeout_ms cannot be negative");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (embedding_timeout_ms < 100) {
      throw std::runtime_error("embedding_timeout_ms must be at least 100ms");
    }
    if (history_capacity <= 0) {
      throw std::runtime_error("history_capacity must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
  }
};

}  // namespace recall_cli
