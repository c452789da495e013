#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "ragdex_core/embedding/embedder.hpp"
#include "ragdex_core/index/vector_index.hpp"
#include "ragdex_core/llm/llamafile_client.hpp"

namespace ragdex_core {

struct QueryOutcome {
  std::vector<SearchHit> hits;  // empty means "no results"
  std::string prompt;
  size_t prompt_tokens = 0;
  std::string answer;
};

/*
Second startup phase: answers queries against a loaded, read-only index.

Each turn embeds the query, retrieves the top-k chunks, renders them, assembles the
prompt from the fixed template and hands it to the completion service. Service
failures end only the current turn; a dimension mismatch ends the session.
*/
class QueryEngine {
 public:
  static constexpr size_t DEFAULT_TOP_K = 3;
  static constexpr size_t PREVIEW_LENGTH = 100;

  QueryEngine(const VectorIndex &index, std::shared_ptr<LlamafileClient> model_client,
              std::ostream &out);

  QueryOutcome answer(const std::string &query, size_t k = DEFAULT_TOP_K);

  // Reads queries until the stream is exhausted. Returns the number of turns answered.
  size_t run(std::istream &in, size_t k = DEFAULT_TOP_K);

  static std::string build_prompt(const std::vector<SearchHit> &hits, const std::string &query);

  // First `length` code points of text
  static std::string preview(const std::string &text, size_t length = PREVIEW_LENGTH);

 private:
  const VectorIndex &index_;
  std::shared_ptr<LlamafileClient> model_client_;
  Embedder embedder_;
  std::ostream &out_;

  void render_results(const std::vector<SearchHit> &hits);
};

}  // namespace ragdex_core
