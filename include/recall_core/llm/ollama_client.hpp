#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace recall_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
Thin HTTP client for the Ollama embedding endpoint (POST /api/embed).
Every request is bounded by the configured timeout. Methods are virtual so
tests can substitute a mock.
*/
class OllamaClient {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
  virtual ~OllamaClient() = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  virtual std::vector<float> get_embedding(const std::string &text);
  // One request for the whole batch; result order follows input order
  virtual std::vector<std::vector<float>> get_embeddings(
      const std::vector<std::string> &texts_to_embed);

  virtual bool is_server_available();

  const std::string &model() const { return embedding_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::chrono::milliseconds timeout_;

  // Returns the response body; throws OllamaError on transport or HTTP failure
  std::string perform_request(const std::string &path, const std::string *post_body);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace recall_core
