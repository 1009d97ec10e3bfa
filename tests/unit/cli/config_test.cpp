#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>

#include "recall_cli/config.hpp"

namespace {

using recall_cli::Config;

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/recall_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    unsetenv("RECALL_DB_KEY");
  }

  void TearDown() override {
    unsetenv("RECALL_DB_KEY");
  }
};

} // namespace

TEST_F(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {
      {"metadata_db_path", "./data/test.db"},
      {"db_key", "secret"},
      {"pool_size", 8},
      {"ollama_url", "http://ollama:11434"},
      {"embedding_model", "nomic-embed-text"},
      {"embedding_dimension", 768},
      {"embedding_timeout_ms", 1500},
      {"history_capacity", 20},
      {"default_top_k", 5}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.metadata_db_path, "./data/test.db");
  EXPECT_EQ(cfg.db_key, "secret");
  EXPECT_EQ(cfg.pool_size, 8);
  EXPECT_EQ(cfg.ollama_url, "http://ollama:11434");
  EXPECT_EQ(cfg.embedding_model, "nomic-embed-text");
  EXPECT_EQ(cfg.embedding_dimension, 768);
  EXPECT_EQ(cfg.embedding_timeout_ms, 1500);
  EXPECT_EQ(cfg.history_capacity, 20);
  EXPECT_EQ(cfg.default_top_k, 5);
}

TEST_F(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json({{"db_key", "secret"}});

  EXPECT_EQ(cfg.metadata_db_path, "./data/recall.db");
  EXPECT_EQ(cfg.pool_size, 4);
  EXPECT_EQ(cfg.pool_acquire_timeout_ms, 5000);
  EXPECT_EQ(cfg.busy_timeout_ms, 5000);
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.embedding_dimension, 1024);
  EXPECT_EQ(cfg.embedding_timeout_ms, 30000);
  EXPECT_EQ(cfg.history_capacity, 10);
  EXPECT_EQ(cfg.default_top_k, 3);
}

TEST_F(ConfigTest, MissingKeyIsRejected) {
  EXPECT_THROW({ (void)Config::from_json(nlohmann::json::object()); }, std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentKeyOverridesFile) {
  setenv("RECALL_DB_KEY", "from-env", 1);

  Config cfg = Config::from_json({{"db_key", "from-file"}});
  EXPECT_EQ(cfg.db_key, "from-env");

  Config without_file_key = Config::from_json(nlohmann::json::object());
  EXPECT_EQ(without_file_key.db_key, "from-env");
}

TEST_F(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "metadata_db_path": "./db/recall.db",
    "db_key": "file-key",
    "embedding_dimension": 384,
    "default_top_k": 7
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.metadata_db_path, "./db/recall.db");
  EXPECT_EQ(cfg.db_key, "file-key");
  EXPECT_EQ(cfg.embedding_dimension, 384);
  EXPECT_EQ(cfg.default_top_k, 7);
}

TEST_F(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/recallrc.json");
  }, std::runtime_error);
}

TEST_F(ConfigTest, MalformedFileThrows) {
  std::string path = write_temp_file("{ not json");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST_F(ConfigTest, WrongTypeIsRejectedNotDefaulted) {
  EXPECT_THROW({ (void)Config::from_json({{"db_key", "k"}, {"pool_size", "four"}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"db_key", 42}}); }, std::runtime_error);
}

TEST_F(ConfigTest, OutOfRangeValuesAreRejected) {
  EXPECT_THROW({ (void)Config::from_json({{"db_key", "k"}, {"history_capacity", 0}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"db_key", "k"}, {"default_top_k", -1}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"db_key", "k"}, {"embedding_dimension", 0}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"db_key", "k"}, {"embedding_timeout_ms", 10}}); },
               std::runtime_error);
  EXPECT_THROW({ (void)Config::from_json({{"db_key", "k"}, {"ollama_url", ""}}); },
               std::runtime_error);
}
