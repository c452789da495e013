#pragma once

#include <string>
#include <vector>

#include "ragdex_core/config.hpp"
#include "ragdex_core/index/index_storage.hpp"

namespace ragdex_core {

class IndexCacheError : public std::exception {
 public:
  explicit IndexCacheError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

enum class CacheDecision {
  Build,                 // nothing persisted yet
  RebuildIncomplete,     // save dir exists without index or document list
  RebuildMissingMarker,  // persisted index has no hash marker beside it
  RebuildStale,          // a local directory hash is not in the marker
  Reuse
};

std::string to_string(CacheDecision decision);

inline bool requires_build(CacheDecision decision) {
  return decision != CacheDecision::Reuse;
}

/*
Decides whether a persisted index can be reused for the configured local directories.

The staleness test is substring containment: each directory's current hash is looked
up anywhere in the marker file's full text. It is not an exact comparison of
(directory, hash) pairs, so a directory dropped from the configuration does not
trigger a rebuild, and neither does a hash that happens to occur inside the
concatenation. URLs never contribute to the marker.
*/
class IndexCache {
 public:
  IndexCache(const Config &config, const IndexStorage &storage);

  CacheDecision evaluate() const;

  // Concatenated hashes of every configured local directory, no delimiter
  std::string compute_marker() const;

  static bool marker_contains_all(const std::string &marker_contents,
                                  const std::vector<std::string> &directory_hashes);

 private:
  std::vector<std::string> directories_;
  const IndexStorage &storage_;

  std::vector<std::string> hash_directories() const;
};

}  // namespace ragdex_core
