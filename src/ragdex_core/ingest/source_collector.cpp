#include "ragdex_core/ingest/source_collector.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "ragdex_core/extractors/html_extractor.hpp"

namespace ragdex_core {

SourceCollector::SourceCollector(const Config &config,
                                 std::shared_ptr<HttpClient> http_client,
                                 std::shared_ptr<const ContentExtractorFactory> extractor_factory)
    : urls_(config.index_urls),
      directories_(config.index_local_data_dirs),
      http_client_(std::move(http_client)),
      extractor_factory_(std::move(extractor_factory)) {
  if (!extractor_factory_) {
    throw SourceCollectorError("SourceCollector requires a content extractor factory");
  }
  if (!urls_.empty() && !http_client_) {
    throw SourceCollectorError("SourceCollector requires an HTTP client when URLs are configured");
  }
}

std::optional<RawDocument> SourceCollector::next() {
  while (next_url_ < urls_.size()) {
    const std::string &url = urls_[next_url_++];
    FetchOutcome outcome = fetch_url(url);
    if (outcome.ok()) {
      return std::move(outcome.document);
    }
    std::cerr << "Warning: skipping " << url << ": " << outcome.failure_reason << std::endl;
    failures_.push_back({url, outcome.failure_reason});
  }

  while (pending_files_.empty()) {
    if (next_directory_ >= directories_.size()) {
      return std::nullopt;
    }
    enqueue_directory(directories_[next_directory_++]);
  }

  PendingFile file = std::move(pending_files_.front());
  pending_files_.pop_front();

  RawDocument document;
  document.origin = file.path.string();
  document.text = file.extractor->extract_text(file.path);
  document.type = file.extractor->get_file_type();
  return document;
}

FetchOutcome SourceCollector::fetch_url(const std::string &url) {
  FetchOutcome outcome;
  try {
    HttpResponse response = http_client_->get(url);
    if (!response.ok()) {
      outcome.failure_reason = "HTTP status " + std::to_string(response.status);
      return outcome;
    }
    RawDocument document;
    document.origin = url;
    document.text = HtmlTextExtractor::extract_visible_text(response.body);
    document.type = DocumentType::Html;
    outcome.document = std::move(document);
  } catch (const HttpError &e) {
    outcome.failure_reason = e.what();
  }
  return outcome;
}

/*
Queues every file under the directory that an extractor can handle. Files are
grouped by extractor (registration order) and sorted by path within a group.
*/
void SourceCollector::enqueue_directory(const std::filesystem::path &directory) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    throw SourceCollectorError("Local data directory does not exist or is not a directory: " +
                               directory.string());
  }

  std::vector<std::filesystem::path> files;
  try {
    for (const auto &entry : std::filesystem::recursive_directory_iterator(directory)) {
      if (entry.is_regular_file()) {
        files.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw SourceCollectorError("Failed to enumerate " + directory.string() + ": " + e.what());
  }
  std::sort(files.begin(), files.end());

  for (const auto &extractor : extractor_factory_->extractors()) {
    for (const auto &path : files) {
      if (extractor->can_handle(path)) {
        pending_files_.push_back({path, extractor.get()});
      }
    }
  }
}

}  // namespace ragdex_core
