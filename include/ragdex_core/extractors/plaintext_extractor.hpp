#pragma once

#include "content_extractor.hpp"

namespace ragdex_core {

class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  std::string extract_text(const fs::path& file_path) const override;

  DocumentType get_file_type() const override {
    return DocumentType::Text;
  }
};

}  // namespace ragdex_core
