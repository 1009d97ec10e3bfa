#pragma once

#include <memory>
#include <string>
#include <vector>

#include "recall_core/llm/ollama_client.hpp"

namespace recall_core {

// The embedding model could not produce a usable vector. Transient: callers
// may retry with backoff.
class EmbeddingUnavailable : public std::exception {
 public:
  explicit EmbeddingUnavailable(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
Validating pass-through to the embedding model. Every vector handed out has
exactly `dimension` finite components; anything else, including transport
failures, surfaces as EmbeddingUnavailable. No retries happen here.
*/
class EmbeddingGateway {
 public:
  EmbeddingGateway(std::shared_ptr<OllamaClient> client, int dimension);

  std::vector<float> embed_one(const std::string &text);
  std::vector<std::vector<float>> embed_many(const std::vector<std::string> &texts);

  bool is_available();
  int dimension() const { return dimension_; }

 private:
  void validate(const std::vector<float> &vector, const std::string &context) const;

  std::shared_ptr<OllamaClient> client_;
  int dimension_;
};

}  // namespace recall_core
