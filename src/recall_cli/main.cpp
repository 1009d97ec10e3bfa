#include <curl/curl.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "recall_cli/cli_handler.hpp"
#include "recall_cli/config.hpp"
#include "recall_core/db/database_manager.hpp"
#include "recall_core/db/vector_record_store.hpp"
#include "recall_core/llm/embedding_gateway.hpp"
#include "recall_core/llm/ollama_client.hpp"

namespace {

recall_cli::Config load_config(const std::string &config_path) {
  if (!config_path.empty()) {
    return recall_cli::Config::from_file(config_path);
  }
  if (std::filesystem::exists("recallrc.json")) {
    return recall_cli::Config::from_file("recallrc.json");
  }
  return recall_cli::Config::from_json(nlohmann::json::object());
}

// Releases process-wide resources on every exit path out of main().
class RuntimeGuard {
 public:
  RuntimeGuard() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }
  }
  ~RuntimeGuard() {
    recall_core::DatabaseManager::get_instance().shutdown();
    curl_global_cleanup();
  }

  RuntimeGuard(const RuntimeGuard &) = delete;
  RuntimeGuard &operator=(const RuntimeGuard &) = delete;
};

int run(const recall_cli::CliOptions &options) {
  recall_cli::Config config = load_config(options.config_path);

  auto db_path = std::filesystem::path(config.metadata_db_path);
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  RuntimeGuard runtime;

  auto &db_manager = recall_core::DatabaseManager::get_instance();
  db_manager.initialize(db_path, config.db_key, config.pool_size,
                        std::chrono::milliseconds(config.pool_acquire_timeout_ms),
                        std::chrono::milliseconds(config.busy_timeout_ms));

  auto ollama_client = std::make_shared<recall_core::OllamaClient>(
      config.ollama_url, config.embedding_model,
      std::chrono::milliseconds(config.embedding_timeout_ms));
  auto gateway =
      std::make_shared<recall_core::EmbeddingGateway>(ollama_client, config.embedding_dimension);
  auto store =
      std::make_shared<recall_core::VectorRecordStore>(db_manager, config.embedding_dimension);

  recall_core::EngineOptions engine_options;
  engine_options.history_capacity = static_cast<std::size_t>(config.history_capacity);
  engine_options.default_top_k = config.default_top_k;
  auto engine = std::make_shared<recall_core::RetrievalEngine>(store, gateway, engine_options);

  recall_cli::CliHandler handler(engine);
  return handler.execute_command(options);
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    recall_cli::CliOptions options = recall_cli::CliHandler::parse_arguments(argc, argv);
    if (options.command == recall_cli::Command::Help) {
      recall_cli::CliHandler::print_help(std::cout);
      return 0;
    }
    return run(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
