#pragma once

#include <gmock/gmock.h>

#include <string>
#include <vector>

#include "recall_core/llm/ollama_client.hpp"
#include "utilities_test.hpp"

namespace recall_tests {

/**
 * Mock class for OllamaClient to use in tests. By default every text maps to
 * TestUtilities::create_test_vector(text), so equal texts embed identically.
 */
class MockOllamaClient : public recall_core::OllamaClient {
 public:
  explicit MockOllamaClient(int dimension = kTestDimension)
      : recall_core::OllamaClient("http://localhost:11434", "mxbai-embed-large") {
    ON_CALL(*this, get_embedding(testing::_))
        .WillByDefault(testing::Invoke([dimension](const std::string &text) {
          return TestUtilities::create_test_vector(text, dimension);
        }));
    ON_CALL(*this, get_embeddings(testing::_))
        .WillByDefault(testing::Invoke([dimension](const std::vector<std::string> &texts) {
          std::vector<std::vector<float>> vectors;
          for (const auto &text : texts) {
            vectors.push_back(TestUtilities::create_test_vector(text, dimension));
          }
          return vectors;
        }));
    ON_CALL(*this, is_server_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string &text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>, get_embeddings,
              (const std::vector<std::string> &texts_to_embed), (override));
  MOCK_METHOD(bool, is_server_available, (), (override));
};

}  // namespace recall_tests
