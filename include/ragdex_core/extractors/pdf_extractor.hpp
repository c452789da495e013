#pragma once

#include "content_extractor.hpp"

namespace ragdex_core {

/**
 * @brief Extracts text from PDF files with poppler-cpp.
 *
 * Pages are concatenated in order with no page-boundary markers. A document
 * that cannot be loaded, or is password-protected, is a ContentExtractorError.
 */
class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  DocumentType get_file_type() const override {
    return DocumentType::PDF;
  }
};

}  // namespace ragdex_core
