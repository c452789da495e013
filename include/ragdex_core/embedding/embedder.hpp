#pragma once

#include <memory>
#include <optional>
#include <string>

#include "ragdex_core/llm/llamafile_client.hpp"
#include "ragdex_core/types/embedding.hpp"

namespace ragdex_core {

class EmbeddingServiceError : public std::exception {
 public:
  explicit EmbeddingServiceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/*
Turns text into a unit-length vector so that inner product equals cosine similarity.

The dimension is fixed per index: establish_dimension() probes the service at build
start, set_dimension() adopts the dimension of a loaded index. Every later embedding
must match it or DimensionMismatchError is thrown.
*/
class Embedder {
 public:
  static constexpr const char *PROBE_TEXT = "Apples are red.";

  explicit Embedder(std::shared_ptr<LlamafileClient> client);

  // Embeds PROBE_TEXT and records its dimension. Returns the dimension.
  size_t establish_dimension();

  void set_dimension(size_t dimension);

  std::optional<size_t> dimension() const {
    return dimension_;
  }

  Embedding embed(const std::string &text);

  // In-place L2 normalization; an all-zero vector is left unchanged.
  static void normalize_l2(Embedding &vector);

 private:
  std::shared_ptr<LlamafileClient> client_;
  std::optional<size_t> dimension_;

  Embedding request_embedding(const std::string &text);
};

}  // namespace ragdex_core
