#include "ragdex_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <memory>

namespace ragdex_core {

bool PdfExtractor::can_handle(const fs::path& file_path) const {
  return file_path.extension() == ".pdf";
}

std::string PdfExtractor::extract_text(const fs::path& file_path) const {
  if (!fs::exists(file_path)) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(file_path.string()));
  if (!doc) {
    throw ContentExtractorError("Failed to load PDF document: " + file_path.string());
  }
  if (doc->is_locked()) {
    throw ContentExtractorError("PDF is encrypted or password-protected: " + file_path.string());
  }

  std::string text;
  const int page_count = doc->pages();
  for (int i = 0; i < page_count; ++i) {
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      throw ContentExtractorError("Failed to read page " + std::to_string(i + 1) + " of " +
                                  file_path.string());
    }
    const poppler::byte_array utf8_page = page->text().to_utf8();
    text.append(utf8_page.begin(), utf8_page.end());
  }

  return sanitize_utf8(text);
}

}  // namespace ragdex_core
