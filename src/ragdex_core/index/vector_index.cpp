#include "ragdex_core/index/vector_index.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace ragdex_core {

VectorIndex::VectorIndex(size_t dimension) {
  if (dimension == 0) {
    throw VectorIndexError("Vector index dimension must be greater than 0");
  }
  index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
}

VectorIndex::VectorIndex(std::unique_ptr<faiss::IndexFlatIP> index,
                         std::vector<std::string> documents)
    : index_(std::move(index)), documents_(std::move(documents)) {
  if (!index_) {
    throw VectorIndexError("Cannot adopt a null faiss index");
  }
  if (static_cast<size_t>(index_->ntotal) != documents_.size()) {
    throw VectorIndexError("Index has " + std::to_string(index_->ntotal) + " entries but " +
                           std::to_string(documents_.size()) + " documents");
  }
}

VectorIndex::~VectorIndex() = default;

VectorIndex::VectorIndex(VectorIndex &&other) noexcept
    : index_(std::move(other.index_)), documents_(std::move(other.documents_)) {}

VectorIndex &VectorIndex::operator=(VectorIndex &&other) noexcept {
  if (this != &other) {
    index_ = std::move(other.index_);
    documents_ = std::move(other.documents_);
  }
  return *this;
}

void VectorIndex::add(const Embedding &vector, std::string document) {
  validate_dimension(vector);

  const float norm = std::sqrt(faiss::fvec_norm_L2sqr(vector.data(), vector.size()));
  if (std::fabs(norm - 1.0f) > NORM_TOLERANCE) {
    throw VectorIndexError("Vector is not L2-normalized (norm " + std::to_string(norm) + ")");
  }

  // Append the text first so a faiss failure cannot leave the two collections misaligned
  documents_.push_back(std::move(document));
  try {
    index_->add(1, vector.data());
  } catch (...) {
    documents_.pop_back();
    throw;
  }
}

std::vector<SearchHit> VectorIndex::search(const Embedding &query_vector, size_t k) const {
  const size_t total = size();
  if (total == 0 || k == 0) {
    return {};
  }
  validate_dimension(query_vector);

  const size_t actual_k = std::min(k, total);
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, query_vector.data(), static_cast<faiss::idx_t>(actual_k), distances.data(),
                 labels.data());

  std::vector<SearchHit> hits;
  hits.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    const auto position = static_cast<size_t>(labels[i]);
    hits.push_back({position, distances[i], documents_[position]});
  }

  // faiss does not promise an order among equal scores
  std::sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.position < b.position;
  });
  return hits;
}

size_t VectorIndex::size() const {
  return static_cast<size_t>(index_->ntotal);
}

size_t VectorIndex::dimension() const {
  return static_cast<size_t>(index_->d);
}

void VectorIndex::validate_dimension(const Embedding &vector) const {
  if (vector.size() != dimension()) {
    throw DimensionMismatchError(dimension(), vector.size());
  }
}

}  // namespace ragdex_core
