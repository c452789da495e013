#include "ragdex_core/llm/llamafile_client.hpp"

#include <utility>

namespace ragdex_core {

namespace {

// Older servers answer {"embedding": [...]}, newer ones wrap it as
// [{"index": 0, "embedding": [[...]]}].
std::vector<float> parse_embedding(const nlohmann::json &json_response) {
  const nlohmann::json *embedding = nullptr;
  if (json_response.is_object() && json_response.contains("embedding")) {
    embedding = &json_response["embedding"];
  } else if (json_response.is_array() && !json_response.empty() &&
             json_response[0].is_object() && json_response[0].contains("embedding")) {
    embedding = &json_response[0]["embedding"];
  } else {
    throw ModelServiceError("Response does not contain embedding field");
  }

  if (!embedding->is_array() || embedding->empty()) {
    throw ModelServiceError("Embedding field is not a non-empty array");
  }
  if ((*embedding)[0].is_array()) {
    // Array of arrays - take the first embedding vector
    embedding = &(*embedding)[0];
  }

  try {
    return embedding->get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw ModelServiceError("Embedding contains non-numeric values: " + std::string(e.what()));
  }
}

}  // namespace

LlamafileClient::LlamafileClient(const Config &config, std::shared_ptr<HttpClient> http_client)
    : embedding_service_url_(config.embedding_service_url),
      generation_service_url_(config.generation_service_url),
      n_predict_(config.completion_n_predict),
      temperature_(config.completion_temperature),
      stop_(config.completion_stop),
      http_client_(std::move(http_client)) {}

std::vector<float> LlamafileClient::embed(const std::string &text) {
  nlohmann::json response = post(join_url(embedding_service_url_, "/embedding"), {{"content", text}});
  return parse_embedding(response);
}

std::vector<int> LlamafileClient::tokenize(const std::string &text) {
  nlohmann::json response =
      post(join_url(generation_service_url_, "/tokenize"), {{"content", text}});
  if (!response.is_object() || !response.contains("tokens") || !response["tokens"].is_array()) {
    throw ModelServiceError("Response does not contain tokens field");
  }

  std::vector<int> tokens;
  tokens.reserve(response["tokens"].size());
  for (const auto &token : response["tokens"]) {
    // with_pieces responses carry objects instead of bare ids
    if (token.is_object() && token.contains("id") && token["id"].is_number_integer()) {
      tokens.push_back(token["id"].get<int>());
    } else if (token.is_number_integer()) {
      tokens.push_back(token.get<int>());
    } else {
      throw ModelServiceError("Unexpected token entry in tokenize response");
    }
  }
  return tokens;
}

std::string LlamafileClient::completion(const std::string &prompt) {
  nlohmann::json request = {{"prompt", prompt},
                            {"n_predict", n_predict_},
                            {"temperature", temperature_},
                            {"stop", stop_},
                            {"stream", false}};
  nlohmann::json response = post(join_url(generation_service_url_, "/completion"), request);
  if (!response.is_object() || !response.contains("content") || !response["content"].is_string()) {
    throw ModelServiceError("Response does not contain content field");
  }
  return response["content"].get<std::string>();
}

nlohmann::json LlamafileClient::post(const std::string &url, const nlohmann::json &body) {
  if (!http_client_) {
    throw ModelServiceError("No HTTP client configured for " + url);
  }
  try {
    return http_client_->post_json(url, body);
  } catch (const HttpError &e) {
    // Wrap transport errors so callers only see the service error type
    throw ModelServiceError("Model service request failed: " + std::string(e.what()));
  }
}

std::string LlamafileClient::join_url(const std::string &base, const std::string &endpoint) {
  if (!base.empty() && base.back() == '/') {
    return base.substr(0, base.size() - 1) + endpoint;
  }
  return base + endpoint;
}

}  // namespace ragdex_core
