#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "ragdex_core/config.hpp"
#include "ragdex_core/types/chunk.hpp"

namespace ragdex_core {

/*
Lazily splits one document into chunks of at most `limit` code points.

Splitting tries paragraph breaks, then line breaks, then sentence ends, then word
gaps, and only cuts inside a word when a piece has none of those. Adjacent pieces
are merged greedily up to the limit; when a chunk is emitted, the trailing pieces
that fit inside `overlap` code points are carried into the next chunk.

Input must be valid UTF-8.
*/
class ChunkStream {
 public:
  ChunkStream(const std::string &text, size_t limit, size_t overlap,
              const std::vector<std::string> &separators);

  std::optional<Chunk> next();

 private:
  struct Piece {
    std::string text;
    size_t length;  // code points
  };

  struct Frame {
    std::vector<Piece> pieces;
    size_t pos = 0;
    std::vector<Piece> mergeable;
    size_t next_level = 0;
  };

  size_t limit_;
  size_t overlap_;
  std::vector<std::string> separators_;
  std::vector<Frame> stack_;
  std::deque<std::string> ready_;
  int next_index_ = 0;

  Frame make_frame(const std::string &text, size_t level) const;
  void merge_into_ready(std::vector<Piece> &pieces);
  void emit(const std::string &candidate);

  static std::vector<Piece> split_keeping_separator(const std::string &text,
                                                    const std::string &separator);
  static std::vector<Piece> split_code_points(const std::string &text);
};

class Chunker {
 public:
  static constexpr size_t DEFAULT_OVERLAP = static_cast<size_t>(Config::CHUNK_OVERLAP);

  explicit Chunker(size_t limit, size_t overlap = DEFAULT_OVERLAP);

  // Uses Config::effective_chunk_len() as the limit
  static Chunker from_config(const Config &config);

  ChunkStream chunk(const std::string &text) const;

  // Convenience for callers that want every chunk at once
  std::vector<Chunk> chunk_all(const std::string &text) const;

  size_t limit() const {
    return limit_;
  }
  size_t overlap() const {
    return overlap_;
  }

  // Length in Unicode code points
  static size_t text_length(const std::string &text);

 private:
  size_t limit_;
  size_t overlap_;
  std::vector<std::string> separators_;
};

}  // namespace ragdex_core
