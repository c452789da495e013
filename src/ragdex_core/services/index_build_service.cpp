#include "ragdex_core/services/index_build_service.hpp"

#include <iostream>
#include <utility>

#include "ragdex_core/index/index_storage.hpp"

namespace ragdex_core {

IndexBuildService::IndexBuildService(
    const Config &config,
    std::shared_ptr<HttpClient> http_client,
    std::shared_ptr<LlamafileClient> model_client,
    std::shared_ptr<const ContentExtractorFactory> extractor_factory)
    : config_(config),
      http_client_(std::move(http_client)),
      model_client_(std::move(model_client)),
      extractor_factory_(std::move(extractor_factory)) {}

BuildReport IndexBuildService::resolve_or_build() {
  IndexStorage storage(config_.index_save_dir);
  IndexCache cache(config_, storage);

  CacheDecision decision = cache.evaluate();
  if (!requires_build(decision)) {
    BuildReport report;
    report.decision = decision;
    return report;
  }
  return rebuild(decision);
}

BuildReport IndexBuildService::rebuild(CacheDecision reason) {
  IndexStorage storage(config_.index_save_dir);
  IndexCache cache(config_, storage);

  SourceCollector collector(config_, http_client_, extractor_factory_);
  Chunker chunker = Chunker::from_config(config_);
  Embedder embedder(model_client_);

  VectorIndex index = build_index(collector, chunker, embedder);

  // The marker reflects the directories as they are after a fully successful build
  storage.save(index, cache.compute_marker());

  BuildReport report;
  report.decision = reason;
  report.entry_count = index.size();
  report.skipped_sources = collector.failures();
  return report;
}

VectorIndex IndexBuildService::build_index(SourceCollector &collector, const Chunker &chunker,
                                           Embedder &embedder) {
  const size_t dimension = embedder.establish_dimension();
  std::cout << "Embedding dimension: " << dimension << std::endl;

  VectorIndex index(dimension);
  while (auto document = collector.next()) {
    size_t chunk_count = 0;
    ChunkStream chunks = chunker.chunk(document->text);
    while (auto chunk = chunks.next()) {
      Embedding embedding = embedder.embed(chunk->content);
      index.add(embedding, std::move(chunk->content));
      ++chunk_count;
    }
    std::cout << "Indexed " << chunk_count << " chunks from " << document->origin << " ("
              << to_string(document->type) << ")" << std::endl;
  }
  return index;
}

}  // namespace ragdex_core
