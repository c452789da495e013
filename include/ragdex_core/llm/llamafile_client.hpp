#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragdex_core/config.hpp"
#include "ragdex_core/net/http_client.hpp"

namespace ragdex_core {

class ModelServiceError : public std::exception {
 public:
  explicit ModelServiceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
Client for the llamafile (llama.cpp server) HTTP API. Embeddings are served by one
model instance, tokenize and completion by the generation model instance.
*/
class LlamafileClient {
 public:
  LlamafileClient(const Config &config, std::shared_ptr<HttpClient> http_client);
  virtual ~LlamafileClient() = default;

  // Disable copy constructor and assignment
  LlamafileClient(const LlamafileClient &) = delete;
  LlamafileClient &operator=(const LlamafileClient &) = delete;

  // Raw (not normalized) embedding for text
  virtual std::vector<float> embed(const std::string &text);

  virtual std::vector<int> tokenize(const std::string &text);

  virtual std::string completion(const std::string &prompt);

 private:
  std::string embedding_service_url_;
  std::string generation_service_url_;
  int n_predict_;
  double temperature_;
  std::vector<std::string> stop_;
  std::shared_ptr<HttpClient> http_client_;

  nlohmann::json post(const std::string &url, const nlohmann::json &body);
  static std::string join_url(const std::string &base, const std::string &endpoint);
};

}  // namespace ragdex_core
