#include "ragdex_core/extractors/content_extractor.hpp"

#include <utf8.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace ragdex_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ContentExtractorError("Failed reading file: " + file_path.string());
  }
  return buffer.str();
}

std::string ContentExtractor::sanitize_utf8(const std::string& text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string out;
  out.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(out));
  return out;
}

}  // namespace ragdex_core
