#include "ragdex_core/embedding/embedder.hpp"

#include <faiss/utils/distances.h>

#include <utility>

namespace ragdex_core {

Embedder::Embedder(std::shared_ptr<LlamafileClient> client) : client_(std::move(client)) {
  if (!client_) {
    throw EmbeddingServiceError("Embedder requires a model client");
  }
}

size_t Embedder::establish_dimension() {
  Embedding probe = request_embedding(PROBE_TEXT);
  dimension_ = probe.size();
  return *dimension_;
}

void Embedder::set_dimension(size_t dimension) {
  if (dimension == 0) {
    throw EmbeddingServiceError("Embedding dimension must be greater than 0");
  }
  dimension_ = dimension;
}

Embedding Embedder::embed(const std::string &text) {
  Embedding embedding = request_embedding(text);

  if (!dimension_) {
    dimension_ = embedding.size();
  } else if (embedding.size() != *dimension_) {
    throw DimensionMismatchError(*dimension_, embedding.size());
  }

  normalize_l2(embedding);
  if (faiss::fvec_norm_L2sqr(embedding.data(), embedding.size()) == 0.0f) {
    throw EmbeddingServiceError("Embedding service returned an all-zero vector");
  }
  return embedding;
}

void Embedder::normalize_l2(Embedding &vector) {
  if (vector.empty()) {
    return;
  }
  faiss::fvec_renorm_L2(vector.size(), 1, vector.data());
}

Embedding Embedder::request_embedding(const std::string &text) {
  Embedding embedding;
  try {
    embedding = client_->embed(text);
  } catch (const ModelServiceError &e) {
    throw EmbeddingServiceError("Embedding request failed: " + std::string(e.what()));
  }
  if (embedding.empty()) {
    throw EmbeddingServiceError("Embedding service returned an empty vector");
  }
  return embedding;
}

}  // namespace ragdex_core
