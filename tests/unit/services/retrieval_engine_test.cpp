#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "recall_core/services/retrieval_engine.hpp"

namespace recall_core {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class RetrievalEngineTest : public recall_tests::VectorStoreTestBase {
 protected:
  void SetUp() override {
    recall_tests::VectorStoreTestBase::SetUp();
    mock_client_ = std::make_shared<NiceMock<recall_tests::MockOllamaClient>>();
    gateway_ = std::make_shared<EmbeddingGateway>(mock_client_, recall_tests::kTestDimension);
    engine_ = std::make_unique<RetrievalEngine>(store_, gateway_);
  }

  void TearDown() override {
    engine_.reset();
    recall_tests::VectorStoreTestBase::TearDown();
  }

  void corrupt_all(const std::string &table, const std::string &assignment) {
    PooledConnection conn(*db_manager_);
    *conn << "UPDATE " + table + " SET " + assignment;
  }

  std::shared_ptr<NiceMock<recall_tests::MockOllamaClient>> mock_client_;
  std::shared_ptr<EmbeddingGateway> gateway_;
  std::unique_ptr<RetrievalEngine> engine_;
};

TEST_F(RetrievalEngineTest, ConversationRoundTrip) {
  for (int i = 1; i <= 12; ++i) {
    engine_->record_turn("u1", "msg" + std::to_string(i));
  }

  auto history = engine_->history("u1");
  ASSERT_EQ(history.size(), 10u);
  EXPECT_EQ(history.front().text, "msg3");
  EXPECT_EQ(history.back().text, "msg12");

  auto recalled = engine_->recall("u1", "msg7");
  ASSERT_EQ(recalled.size(), 3u);  // default top-k
  EXPECT_EQ(recalled[0].text, "msg7");

  EXPECT_EQ(engine_->list_users(), (std::vector<std::string>{"u1"}));
  EXPECT_EQ(engine_->clear_history("u1"), 10u);
  EXPECT_EQ(engine_->clear_all_history(), 0u);
}

TEST_F(RetrievalEngineTest, DocumentRoundTripWithVisibilityTag) {
  EXPECT_EQ(engine_->ingest({{"shared text", {{"page", "1"}}}}, "u1", "doc.pdf", "shared"), 1u);
  EXPECT_EQ(engine_->ingest({{"private text", {}}}, "u1", "notes.txt"), 1u);

  auto hits = engine_->retrieve("u2", "shared text", 5);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].source, "doc.pdf");
  EXPECT_EQ(hits[0].metadata.at("page"), "1");

  EXPECT_EQ(engine_->list_sources().size(), 2u);
  EXPECT_EQ(engine_->purge_by_source("doc.pdf"), 1u);
  EXPECT_EQ(engine_->purge_by_source_and_user("notes.txt", "u1"), 1u);
  EXPECT_EQ(engine_->purge_by_user("u1"), 0u);
  EXPECT_EQ(engine_->purge_all(), 0u);
}

TEST_F(RetrievalEngineTest, ExplicitTopKOverridesDefault) {
  for (int i = 0; i < 6; ++i) {
    engine_->record_turn("u1", "turn" + std::to_string(i));
  }
  EXPECT_EQ(engine_->recall("u1", "turn1", 5).size(), 5u);

  RetrievalEngine wide(store_, gateway_, EngineOptions{10, 4});
  EXPECT_EQ(wide.recall("u1", "turn1").size(), 4u);
}

TEST_F(RetrievalEngineTest, EmbeddingOutageIsRetryable) {
  EXPECT_CALL(*mock_client_, get_embedding(_)).WillRepeatedly(Throw(OllamaError("refused")));

  try {
    engine_->record_turn("u1", "hello");
    FAIL() << "Expected RetrievalUnavailable";
  } catch (const RetrievalUnavailable &e) {
    EXPECT_TRUE(e.retryable());
  }
  EXPECT_THROW(engine_->retrieve("u1", "hello"), RetrievalUnavailable);
}

TEST_F(RetrievalEngineTest, StoreOutageIsRetryable) {
  db_manager_->shutdown();

  EXPECT_THROW(engine_->record_turn("u1", "hello"), RetrievalUnavailable);
  EXPECT_THROW(engine_->history("u1"), RetrievalUnavailable);
  EXPECT_THROW(engine_->ingest({{"x", {}}}, "u1", "doc"), RetrievalUnavailable);
}

TEST_F(RetrievalEngineTest, InvalidInputIsRejectedNotRetryable) {
  try {
    engine_->record_turn("", "hello");
    FAIL() << "Expected RetrievalRejected";
  } catch (const RetrievalRejected &e) {
    EXPECT_FALSE(e.retryable());
  }
  EXPECT_THROW(engine_->recall("u1", "q", 0), RetrievalRejected);
  EXPECT_THROW(engine_->retrieve("u1", "q", -3), RetrievalRejected);
  EXPECT_THROW(engine_->ingest({{"x", {}}}, "u1", "doc", "public"), RetrievalRejected);
  EXPECT_THROW(engine_->purge_by_source(""), RetrievalRejected);
}

TEST_F(RetrievalEngineTest, StoredDimensionMismatchIsRejected) {
  engine_->record_turn("u1", "hello");
  corrupt_all("conversation_turns", "vector_blob = zeroblob(4)");

  EXPECT_THROW(engine_->history("u1"), RetrievalRejected);
}

TEST_F(RetrievalEngineTest, OtherStoreFailuresUseBaseError) {
  engine_->ingest({{"text", {}}}, "u1", "doc", "shared");
  corrupt_all("document_fragments", "metadata_json = 'not json'");

  try {
    engine_->retrieve("u1", "text");
    FAIL() << "Expected RetrievalError";
  } catch (const RetrievalUnavailable &) {
    FAIL() << "Corrupt metadata is not a transient failure";
  } catch (const RetrievalRejected &) {
    FAIL() << "Corrupt metadata is not the caller's fault";
  } catch (const RetrievalError &e) {
    EXPECT_FALSE(e.retryable());
  }
}

TEST_F(RetrievalEngineTest, HealthReportsEachDependency) {
  auto status = engine_->health();
  EXPECT_TRUE(status.store_ok);
  EXPECT_TRUE(status.embedding_ok);
  EXPECT_TRUE(status.healthy());

  EXPECT_CALL(*mock_client_, is_server_available()).WillOnce(Return(false));
  db_manager_->shutdown();

  status = engine_->health();
  EXPECT_FALSE(status.store_ok);
  EXPECT_FALSE(status.store_error.empty());
  EXPECT_FALSE(status.embedding_ok);
  EXPECT_FALSE(status.healthy());
}

TEST_F(RetrievalEngineTest, ConstructorRejectsInconsistentConfiguration) {
  auto wrong_gateway =
      std::make_shared<EmbeddingGateway>(mock_client_, recall_tests::kTestDimension * 2);
  EXPECT_THROW(RetrievalEngine(store_, wrong_gateway), std::invalid_argument);
  EXPECT_THROW(RetrievalEngine(store_, gateway_, EngineOptions{10, 0}), std::invalid_argument);
  EXPECT_THROW(RetrievalEngine(store_, gateway_, EngineOptions{0, 3}), std::invalid_argument);
}

}  // namespace recall_core
