#include "ragdex_core/index/index_cache.hpp"

#include <iostream>

#include "ragdex_core/index/directory_hasher.hpp"

namespace ragdex_core {

std::string to_string(CacheDecision decision) {
  switch (decision) {
    case CacheDecision::Build:
      return "BUILD";
    case CacheDecision::RebuildIncomplete:
      return "REBUILD_INCOMPLETE";
    case CacheDecision::RebuildMissingMarker:
      return "REBUILD_MISSING_MARKER";
    case CacheDecision::RebuildStale:
      return "REBUILD_STALE";
    case CacheDecision::Reuse:
      return "REUSE";
    default:
      return "UNKNOWN";
  }
}

IndexCache::IndexCache(const Config &config, const IndexStorage &storage)
    : directories_(config.index_local_data_dirs), storage_(storage) {}

CacheDecision IndexCache::evaluate() const {
  if (!storage_.exists()) {
    return CacheDecision::Build;
  }
  if (!storage_.is_complete()) {
    std::cerr << "Warning: index at " << storage_.save_dir().string()
              << " is incomplete, rebuilding index" << std::endl;
    return CacheDecision::RebuildIncomplete;
  }
  if (!storage_.has_hash_marker()) {
    std::cerr << "Warning: index dir hash file not found, rebuilding index" << std::endl;
    return CacheDecision::RebuildMissingMarker;
  }

  std::string marker;
  try {
    marker = storage_.read_hash_marker();
  } catch (const IndexStorageError &e) {
    throw IndexCacheError("Failed to read hash marker: " + std::string(e.what()));
  }

  if (!marker_contains_all(marker, hash_directories())) {
    std::cerr << "Warning: index dir hash mismatch, rebuilding index" << std::endl;
    return CacheDecision::RebuildStale;
  }

  std::cout << "index already exists, skipping build" << std::endl;
  return CacheDecision::Reuse;
}

std::string IndexCache::compute_marker() const {
  std::string marker;
  for (const auto &directory_hash : hash_directories()) {
    marker += directory_hash;
  }
  return marker;
}

bool IndexCache::marker_contains_all(const std::string &marker_contents,
                                     const std::vector<std::string> &directory_hashes) {
  for (const auto &directory_hash : directory_hashes) {
    if (marker_contents.find(directory_hash) == std::string::npos) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> IndexCache::hash_directories() const {
  std::vector<std::string> hashes;
  hashes.reserve(directories_.size());
  for (const auto &directory : directories_) {
    hashes.push_back(DirectoryHasher::hash_directory(directory));
  }
  return hashes;
}

}  // namespace ragdex_core
