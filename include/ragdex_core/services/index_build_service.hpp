#pragma once

#include <memory>
#include <vector>

#include "ragdex_core/config.hpp"
#include "ragdex_core/embedding/embedder.hpp"
#include "ragdex_core/extractors/content_extractor_factory.hpp"
#include "ragdex_core/index/index_cache.hpp"
#include "ragdex_core/index/vector_index.hpp"
#include "ragdex_core/ingest/chunker.hpp"
#include "ragdex_core/ingest/source_collector.hpp"
#include "ragdex_core/llm/llamafile_client.hpp"
#include "ragdex_core/net/http_client.hpp"

namespace ragdex_core {

struct BuildReport {
  CacheDecision decision = CacheDecision::Build;
  size_t entry_count = 0;  // entries written by this run; 0 when the index was reused
  std::vector<SourceFailure> skipped_sources;

  bool built() const {
    return requires_build(decision);
  }
};

/*
First startup phase: reuse the persisted index when IndexCache allows it, otherwise
ingest every source, embed every chunk and persist the result.

Sources, chunks and embeddings are processed strictly one at a time. A URL that
cannot be fetched is skipped; any other failure (local file, embedding service,
dimension mismatch, persistence) aborts the build and nothing is published.
*/
class IndexBuildService {
 public:
  IndexBuildService(const Config &config,
                    std::shared_ptr<HttpClient> http_client,
                    std::shared_ptr<LlamafileClient> model_client,
                    std::shared_ptr<const ContentExtractorFactory> extractor_factory);

  BuildReport resolve_or_build();

  // Builds and persists unconditionally
  BuildReport rebuild(CacheDecision reason = CacheDecision::Build);

  // In-memory build from already constructed stages
  static VectorIndex build_index(SourceCollector &collector, const Chunker &chunker,
                                 Embedder &embedder);

 private:
  const Config &config_;
  std::shared_ptr<HttpClient> http_client_;
  std::shared_ptr<LlamafileClient> model_client_;
  std::shared_ptr<const ContentExtractorFactory> extractor_factory_;
};

}  // namespace ragdex_core
