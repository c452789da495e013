#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

namespace ragdex_core {

/**
 * @class ContentExtractorFactory
 * @brief Owns the file extractors used for local directory ingestion.
 *
 * Extractors are kept in registration order (plain text, then PDF); the
 * source collector walks a directory once per extractor in this order.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  const std::vector<ContentExtractorPtr>& extractors() const {
    return extractors_;
  }

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors_;
};

}  // namespace ragdex_core
