#include "ragdex_core/extractors/plaintext_extractor.hpp"

namespace ragdex_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return file_path.extension() == ".txt";
}

std::string PlainTextExtractor::extract_text(const fs::path& file_path) const {
  return sanitize_utf8(get_string_content(file_path));
}

}  // namespace ragdex_core
