#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "recall_core/db/database_manager.hpp"
#include "recall_core/db/pooled_connection.hpp"
#include "recall_core/db/vector_record_store.hpp"
#include "recall_core/types/vector_record.hpp"

namespace recall_tests {

// Small enough to reason about by hand, large enough to spread random vectors
constexpr int kTestDimension = 8;
constexpr const char *kTestDbKey = "recall_test_key";

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path &db_path);

  // Deterministic pseudo-random vector derived from the seed text
  static std::vector<float> create_test_vector(const std::string &seed_text,
                                               int dimension = kTestDimension);

  // Unit vector along one axis; optionally scaled
  static std::vector<float> axis_vector(int axis, float scale = 1.0f,
                                        int dimension = kTestDimension);

  // Unit vector at `degrees` from axis 0 towards axis 1
  static std::vector<float> angled_vector(double degrees, int dimension = kTestDimension);

  static recall_core::ConversationTurn create_test_turn(const std::string &owner,
                                                        const std::string &text,
                                                        std::vector<float> embedding = {});

  static recall_core::DocumentFragment create_test_fragment(
      const std::string &owner,
      const std::string &source,
      recall_core::Visibility visibility,
      const std::string &text,
      std::vector<float> embedding = {},
      recall_core::Metadata metadata = {});
};

/**
 * Base test fixture that provides a freshly initialised encrypted database and
 * a VectorRecordStore of kTestDimension over it
 */
class VectorStoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    auto &mgr = recall_core::DatabaseManager::get_instance();
    // If a previous test left the DB initialized, shut it down to re-init with a fresh temp path
    mgr.shutdown();
    mgr.initialize(temp_db_path_, kTestDbKey, /*pool_size*/ 4);
    db_manager_ = &mgr;
    store_ = std::make_shared<recall_core::VectorRecordStore>(*db_manager_, kTestDimension);
  }

  void TearDown() override {
    store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  long long row_count(const std::string &table) {
    recall_core::PooledConnection conn(*db_manager_);
    long long count = 0;
    *conn << "SELECT COUNT(*) FROM " + table >> count;
    return count;
  }

  std::filesystem::path temp_db_path_;
  recall_core::DatabaseManager *db_manager_ = nullptr;
  std::shared_ptr<recall_core::VectorRecordStore> store_;
};

}  // namespace recall_tests
