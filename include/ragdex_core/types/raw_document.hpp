#pragma once

#include <string>

namespace ragdex_core {

// Where a document's text came from
enum class DocumentType { Html, Text, PDF, Unknown };

std::string to_string(DocumentType type);

struct RawDocument {
  std::string origin;  // URL or file path
  std::string text;
  DocumentType type = DocumentType::Unknown;
};

}  // namespace ragdex_core
