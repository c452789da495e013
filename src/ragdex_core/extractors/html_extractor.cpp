#include "ragdex_core/extractors/html_extractor.hpp"

#include <gumbo.h>

#include "ragdex_core/extractors/content_extractor.hpp"

namespace ragdex_core {

namespace {

bool is_hidden_element(GumboTag tag) {
  return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT ||
         tag == GUMBO_TAG_TEMPLATE;
}

void collect_text(const GumboNode* node, std::string& out) {
  if (!node) {
    return;
  }
  switch (node->type) {
    case GUMBO_NODE_TEXT:
    case GUMBO_NODE_WHITESPACE:
    case GUMBO_NODE_CDATA:
      out.append(node->v.text.text);
      return;
    case GUMBO_NODE_ELEMENT:
    case GUMBO_NODE_TEMPLATE:
      if (is_hidden_element(node->v.element.tag)) {
        return;
      }
      break;
    case GUMBO_NODE_DOCUMENT:
      break;
    default:
      // comments
      return;
  }

  const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
                                    ? &node->v.document.children
                                    : &node->v.element.children;
  for (unsigned int i = 0; i < children->length; ++i) {
    collect_text(static_cast<const GumboNode*>(children->data[i]), out);
  }
}

}  // namespace

std::string HtmlTextExtractor::extract_visible_text(const std::string& html) {
  GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
  std::string text;
  collect_text(output->document, text);
  gumbo_destroy_output(&kGumboDefaultOptions, output);
  return ContentExtractor::sanitize_utf8(text);
}

}  // namespace ragdex_core
