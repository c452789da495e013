#pragma once

#include <string>

namespace ragdex_core {

// Strips markup from an HTML page, keeping the text a browser would render.
class HtmlTextExtractor {
 public:
  static std::string extract_visible_text(const std::string& html);
};

}  // namespace ragdex_core
