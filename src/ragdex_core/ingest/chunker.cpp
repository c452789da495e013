#include "ragdex_core/ingest/chunker.hpp"

#include <utf8.h>

#include <stdexcept>
#include <utility>

namespace ragdex_core {

namespace {

// Paragraph, line, sentence, word; an empty separator means cut between code points.
const std::vector<std::string> kDefaultSeparators = {"\n\n", "\n", ". ", " ", ""};

constexpr const char *kWhitespace = " \t\n\r\f\v";

std::string strip(const std::string &text) {
  const size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  const size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

}  // namespace

ChunkStream::ChunkStream(const std::string &text, size_t limit, size_t overlap,
                         const std::vector<std::string> &separators)
    : limit_(limit), overlap_(overlap), separators_(separators) {
  if (!text.empty()) {
    stack_.push_back(make_frame(text, 0));
  }
}

std::optional<Chunk> ChunkStream::next() {
  while (ready_.empty()) {
    if (stack_.empty()) {
      return std::nullopt;
    }

    Frame &frame = stack_.back();
    if (frame.pos == frame.pieces.size()) {
      merge_into_ready(frame.mergeable);
      stack_.pop_back();
      continue;
    }

    Piece piece = std::move(frame.pieces[frame.pos++]);
    if (piece.length < limit_) {
      frame.mergeable.push_back(std::move(piece));
      continue;
    }

    // Too long: flush what is pending at this level, then split the piece finer.
    merge_into_ready(frame.mergeable);
    if (frame.next_level >= separators_.size()) {
      emit(piece.text);
      continue;
    }
    const size_t level = frame.next_level;
    stack_.push_back(make_frame(piece.text, level));  // invalidates `frame`
  }

  Chunk chunk{.content = std::move(ready_.front()), .chunk_index = next_index_++};
  ready_.pop_front();
  return chunk;
}

ChunkStream::Frame ChunkStream::make_frame(const std::string &text, size_t level) const {
  Frame frame;
  for (size_t i = level; i < separators_.size(); ++i) {
    const std::string &separator = separators_[i];
    if (separator.empty()) {
      frame.pieces = split_code_points(text);
      frame.next_level = i + 1;
      return frame;
    }
    if (text.find(separator) != std::string::npos) {
      frame.pieces = split_keeping_separator(text, separator);
      frame.next_level = i + 1;
      return frame;
    }
  }
  // No separator applies and no hard-cut level configured: keep the text whole.
  frame.pieces.push_back({text, Chunker::text_length(text)});
  frame.next_level = separators_.size();
  return frame;
}

void ChunkStream::merge_into_ready(std::vector<Piece> &pieces) {
  if (pieces.empty()) {
    return;
  }

  std::deque<const Piece *> current;
  size_t total = 0;

  for (const Piece &piece : pieces) {
    if (total + piece.length > limit_ && !current.empty()) {
      std::string joined;
      for (const Piece *p : current) {
        joined += p->text;
      }
      emit(joined);

      // Keep a tail no longer than the overlap that still leaves room for this piece
      while (total > overlap_ || (total + piece.length > limit_ && total > 0)) {
        total -= current.front()->length;
        current.pop_front();
      }
    }
    current.push_back(&piece);
    total += piece.length;
  }

  std::string joined;
  for (const Piece *p : current) {
    joined += p->text;
  }
  emit(joined);
  pieces.clear();
}

void ChunkStream::emit(const std::string &candidate) {
  std::string stripped = strip(candidate);
  if (!stripped.empty()) {
    ready_.push_back(std::move(stripped));
  }
}

std::vector<ChunkStream::Piece> ChunkStream::split_keeping_separator(const std::string &text,
                                                                     const std::string &separator) {
  std::vector<Piece> pieces;
  size_t start = 0;
  size_t found = text.find(separator);
  while (found != std::string::npos) {
    const size_t end = found + separator.size();
    std::string piece = text.substr(start, end - start);
    pieces.push_back({piece, Chunker::text_length(piece)});
    start = end;
    found = text.find(separator, start);
  }
  if (start < text.size()) {
    std::string piece = text.substr(start);
    pieces.push_back({piece, Chunker::text_length(piece)});
  }
  return pieces;
}

std::vector<ChunkStream::Piece> ChunkStream::split_code_points(const std::string &text) {
  std::vector<Piece> pieces;
  auto it = text.begin();
  while (it != text.end()) {
    auto begin = it;
    utf8::next(it, text.end());
    pieces.push_back({std::string(begin, it), 1});
  }
  return pieces;
}

Chunker::Chunker(size_t limit, size_t overlap)
    : limit_(limit), overlap_(overlap), separators_(kDefaultSeparators) {
  if (limit_ == 0) {
    throw std::invalid_argument("Chunk length limit must be greater than 0");
  }
  if (overlap_ >= limit_) {
    throw std::invalid_argument("Chunk overlap (" + std::to_string(overlap_) +
                                ") must be smaller than the chunk length limit (" +
                                std::to_string(limit_) + ")");
  }
}

Chunker Chunker::from_config(const Config &config) {
  return Chunker(config.effective_chunk_len());
}

ChunkStream Chunker::chunk(const std::string &text) const {
  return ChunkStream(text, limit_, overlap_, separators_);
}

std::vector<Chunk> Chunker::chunk_all(const std::string &text) const {
  std::vector<Chunk> chunks;
  ChunkStream stream = chunk(text);
  while (auto next = stream.next()) {
    chunks.push_back(std::move(*next));
  }
  return chunks;
}

size_t Chunker::text_length(const std::string &text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

}  // namespace ragdex_core
