#include "recall_core/llm/ollama_client.hpp"

#include <curl/curl.h>

#include <memory>

namespace recall_core {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlHeaderDeleter {
  void operator()(curl_slist *headers) const {
    curl_slist_free_all(headers);
  }
};

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           std::chrono::milliseconds timeout)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), timeout_(timeout) {
  while (!ollama_url_.empty() && ollama_url_.back() == '/') {
    ollama_url_.pop_back();
  }
  if (ollama_url_.empty()) {
    throw OllamaError("Ollama URL cannot be empty");
  }
}

size_t OllamaClient::write_callback(void *contents, size_t size, size_t nmemb,
                                    std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string OllamaClient::perform_request(const std::string &path, const std::string *post_body) {
  std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
  if (!curl) {
    throw OllamaError("Failed to initialize CURL");
  }

  std::string url = ollama_url_ + path;
  std::string response_body;
  std::unique_ptr<curl_slist, CurlHeaderDeleter> headers;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  if (post_body) {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw OllamaError("Request to " + url + " failed: " + curl_easy_strerror(res));
  }

  long response_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
  if (response_code != 200) {
    std::string detail = response_body;
    auto parsed = nlohmann::json::parse(response_body, nullptr, /*allow_exceptions*/ false);
    if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_string()) {
      detail = parsed["error"].get<std::string>();
    }
    throw OllamaError("Ollama returned HTTP " + std::to_string(response_code) + " for " + path +
                      ": " + detail);
  }

  return response_body;
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  auto embeddings = get_embeddings({text});
  return std::move(embeddings.front());
}

std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts_to_embed) {
  if (texts_to_embed.empty()) {
    return {};
  }

  nlohmann::json request = {{"model", embedding_model_}, {"input", texts_to_embed}};
  const std::string body = request.dump();
  const std::string response_body = perform_request("/api/embed", &body);

  try {
    auto json_response = nlohmann::json::parse(response_body);

    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      throw OllamaError("Response does not contain an embeddings array");
    }

    auto embeddings = json_response["embeddings"].get<std::vector<std::vector<float>>>();
    if (embeddings.size() != texts_to_embed.size()) {
      throw OllamaError("Requested " + std::to_string(texts_to_embed.size()) +
                        " embeddings, received " + std::to_string(embeddings.size()));
    }
    return embeddings;
  } catch (const nlohmann::json::exception &e) {
    throw OllamaError("Malformed embedding response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  try {
    perform_request("/api/tags", nullptr);
    return true;
  } catch (const OllamaError &) {
    return false;
  }
}

}  // namespace recall_core
