#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "ragdex_core/types/raw_document.hpp"

namespace fs = std::filesystem;

namespace ragdex_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  // Opens the file and returns its full text as valid UTF-8
  virtual std::string extract_text(const fs::path& file_path) const = 0;

  virtual DocumentType get_file_type() const = 0;

  // Replaces invalid UTF-8 sequences so downstream length math never throws
  static std::string sanitize_utf8(const std::string& text);

 protected:
  std::string get_string_content(const fs::path& file_path) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace ragdex_core
