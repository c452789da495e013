#include "ragdex_core/types/raw_document.hpp"

namespace ragdex_core {

std::string to_string(DocumentType type) {
  switch (type) {
    case DocumentType::Html:
      return "html";
    case DocumentType::Text:
      return "text";
    case DocumentType::PDF:
      return "pdf";
    case DocumentType::Unknown:
    default:
      return "unknown";
  }
}

}  // namespace ragdex_core
