#include "recall_core/llm/embedding_gateway.hpp"

#include <cmath>
#include <stdexcept>

namespace recall_core {

EmbeddingGateway::EmbeddingGateway(std::shared_ptr<OllamaClient> client, int dimension)
    : client_(std::move(client)), dimension_(dimension) {
  if (!client_) {
    throw std::invalid_argument("EmbeddingGateway requires an Ollama client");
  }
  if (dimension_ <= 0) {
    throw std::invalid_argument("Embedding dimension must be greater than 0");
  }
}

void EmbeddingGateway::validate(const std::vector<float> &vector,
                                const std::string &context) const {
  if (vector.size() != static_cast<size_t>(dimension_)) {
    throw EmbeddingUnavailable(context + ": model returned " + std::to_string(vector.size()) +
                               " dimensions, expected " + std::to_string(dimension_));
  }
  for (float value : vector) {
    if (!std::isfinite(value)) {
      throw EmbeddingUnavailable(context + ": model returned a non-finite component");
    }
  }
}

std::vector<float> EmbeddingGateway::embed_one(const std::string &text) {
  std::vector<float> vector;
  try {
    vector = client_->get_embedding(text);
  } catch (const OllamaError &e) {
    throw EmbeddingUnavailable(std::string("Embedding request failed: ") + e.what());
  }
  validate(vector, "embed_one");
  return vector;
}

std::vector<std::vector<float>> EmbeddingGateway::embed_many(
    const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  std::vector<std::vector<float>> vectors;
  try {
    vectors = client_->get_embeddings(texts);
  } catch (const OllamaError &e) {
    throw EmbeddingUnavailable(std::string("Batch embedding request failed: ") + e.what());
  }

  if (vectors.size() != texts.size()) {
    throw EmbeddingUnavailable("embed_many: requested " + std::to_string(texts.size()) +
                               " vectors, received " + std::to_string(vectors.size()));
  }
  for (size_t i = 0; i < vectors.size(); ++i) {
    validate(vectors[i], "embed_many[" + std::to_string(i) + "]");
  }
  return vectors;
}

bool EmbeddingGateway::is_available() {
  return client_->is_server_available();
}

}  // namespace recall_core
