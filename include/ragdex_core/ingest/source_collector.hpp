#pragma once

#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ragdex_core/config.hpp"
#include "ragdex_core/extractors/content_extractor_factory.hpp"
#include "ragdex_core/net/http_client.hpp"
#include "ragdex_core/types/raw_document.hpp"

namespace ragdex_core {

class SourceCollectorError : public std::exception {
 public:
  explicit SourceCollectorError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Result of fetching one URL: either a document or the reason it was skipped.
struct FetchOutcome {
  std::optional<RawDocument> document;
  std::string failure_reason;

  bool ok() const {
    return document.has_value();
  }
};

struct SourceFailure {
  std::string origin;
  std::string reason;
};

/*
Produces raw documents one at a time: every configured URL first, then every file
under each configured local directory.

URL ingestion is best-effort: a network error or non-2xx status is logged, recorded
in failures() and the URL is skipped. Local directories are trusted, so read and
parse errors there propagate and abort the caller.

The sequence is finite and cannot be restarted; next() returns std::nullopt once
all sources are exhausted.
*/
class SourceCollector {
 public:
  SourceCollector(const Config &config,
                  std::shared_ptr<HttpClient> http_client,
                  std::shared_ptr<const ContentExtractorFactory> extractor_factory);

  SourceCollector(const SourceCollector &) = delete;
  SourceCollector &operator=(const SourceCollector &) = delete;

  std::optional<RawDocument> next();

  FetchOutcome fetch_url(const std::string &url);

  const std::vector<SourceFailure> &failures() const {
    return failures_;
  }

 private:
  struct PendingFile {
    std::filesystem::path path;
    const ContentExtractor *extractor;
  };

  std::vector<std::string> urls_;
  std::vector<std::string> directories_;
  std::shared_ptr<HttpClient> http_client_;
  std::shared_ptr<const ContentExtractorFactory> extractor_factory_;

  size_t next_url_ = 0;
  size_t next_directory_ = 0;
  std::deque<PendingFile> pending_files_;
  std::vector<SourceFailure> failures_;

  void enqueue_directory(const std::filesystem::path &directory);
};

}  // namespace ragdex_core
