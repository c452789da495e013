#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <string>
#include <vector>

#include "ragdex_core/types/embedding.hpp"

namespace ragdex_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SearchHit {
  size_t position;  // insertion order, also the document position
  float score;      // inner product == cosine similarity
  std::string text;
};

/*
Exact inner-product index over unit-length vectors, paired with the chunk text each
vector was computed from. Position i in the faiss index and in documents() always
refers to the same chunk. Entries are only ever appended.
*/
class VectorIndex {
 public:
  explicit VectorIndex(size_t dimension);

  // Adopts a deserialized index; the document count must equal the entry count.
  VectorIndex(std::unique_ptr<faiss::IndexFlatIP> index, std::vector<std::string> documents);

  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  VectorIndex(VectorIndex &&) noexcept;
  VectorIndex &operator=(VectorIndex &&) noexcept;

  void add(const Embedding &vector, std::string document);

  // Top-k by score, highest first; equal scores keep insertion order. Returns all
  // entries when k exceeds size() and nothing for an empty index.
  std::vector<SearchHit> search(const Embedding &query_vector, size_t k) const;

  size_t size() const;
  size_t dimension() const;

  const std::vector<std::string> &documents() const {
    return documents_;
  }

  const faiss::IndexFlatIP &faiss_index() const {
    return *index_;
  }

 private:
  std::unique_ptr<faiss::IndexFlatIP> index_;
  std::vector<std::string> documents_;

  static constexpr float NORM_TOLERANCE = 1e-3f;

  void validate_dimension(const Embedding &vector) const;
};

}  // namespace ragdex_core
