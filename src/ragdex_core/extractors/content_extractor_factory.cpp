#include "ragdex_core/extractors/content_extractor_factory.hpp"

#include "ragdex_core/extractors/pdf_extractor.hpp"
#include "ragdex_core/extractors/plaintext_extractor.hpp"

namespace ragdex_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors_.push_back(std::make_unique<PlainTextExtractor>());
  extractors_.push_back(std::make_unique<PdfExtractor>());
}

}  // namespace ragdex_core
