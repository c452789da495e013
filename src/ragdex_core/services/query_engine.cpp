#include "ragdex_core/services/query_engine.hpp"

#include <utf8.h>

#include <iomanip>
#include <iostream>
#include <utility>

namespace ragdex_core {

namespace {

const std::string kSeparator(80, '-');

constexpr const char *kPromptPrefix =
    "You are an expert Q&A system. Answer the user's query using the provided context "
    "information.\n"
    "Context information:\n";

bool is_blank(const std::string &line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

QueryEngine::QueryEngine(const VectorIndex &index, std::shared_ptr<LlamafileClient> model_client,
                         std::ostream &out)
    : index_(index), model_client_(model_client), embedder_(std::move(model_client)), out_(out) {
  embedder_.set_dimension(index_.dimension());
}

QueryOutcome QueryEngine::answer(const std::string &query, size_t k) {
  QueryOutcome outcome;

  out_ << "=== Query ===" << std::endl;
  out_ << query << std::endl << std::endl;

  Embedding query_vector = embedder_.embed(query);
  outcome.hits = index_.search(query_vector, k);
  render_results(outcome.hits);

  out_ << "=== Prompt ===" << std::endl;
  outcome.prompt = build_prompt(outcome.hits, query);
  out_ << '"' << outcome.prompt << '"' << std::endl;
  outcome.prompt_tokens = model_client_->tokenize(outcome.prompt).size();
  out_ << "(prompt_ntokens: " << outcome.prompt_tokens << ")" << std::endl;
  out_ << std::endl << std::endl;

  out_ << "=== Answer ===" << std::endl;
  outcome.answer = model_client_->completion(outcome.prompt);
  out_ << '"' << outcome.answer << '"' << std::endl << std::endl;
  out_ << kSeparator << std::endl;

  return outcome;
}

size_t QueryEngine::run(std::istream &in, size_t k) {
  size_t answered = 0;
  std::string line;
  while (true) {
    out_ << "Enter query (ctrl-d to quit):> " << std::flush;
    if (!std::getline(in, line)) {
      out_ << std::endl;
      return answered;
    }
    if (is_blank(line)) {
      continue;
    }

    try {
      answer(line, k);
      ++answered;
    } catch (const EmbeddingServiceError &e) {
      out_ << std::endl << "Error: " << e.what() << std::endl << kSeparator << std::endl;
    } catch (const ModelServiceError &e) {
      out_ << std::endl << "Error: " << e.what() << std::endl << kSeparator << std::endl;
    }
  }
}

std::string QueryEngine::build_prompt(const std::vector<SearchHit> &hits,
                                      const std::string &query) {
  std::string context;
  for (size_t i = 0; i < hits.size(); ++i) {
    if (i > 0) {
      context += "\n";
    }
    context += hits[i].text;
  }
  return std::string(kPromptPrefix) + context + "\nQuery: " + query;
}

std::string QueryEngine::preview(const std::string &text, size_t length) {
  auto it = text.begin();
  for (size_t i = 0; i < length && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

void QueryEngine::render_results(const std::vector<SearchHit> &hits) {
  out_ << "=== Search Results ===" << std::endl;
  if (hits.empty()) {
    out_ << "No results found." << std::endl;
  }
  for (const auto &hit : hits) {
    out_ << std::fixed << std::setprecision(4) << hit.score << " - \"" << preview(hit.text)
         << "\"" << std::endl;
  }
  out_ << std::endl;
}

}  // namespace ragdex_core
