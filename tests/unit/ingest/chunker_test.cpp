#include "ragdex_core/ingest/chunker.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <iomanip>
#include <sstream>

namespace ragdex_core {

namespace {

// "word00 word01 ... wordNN", every word unique and 6 characters long
std::string numbered_words(int count) {
  std::ostringstream out;
  for (int i = 0; i < count; ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << "word" << std::setw(2) << std::setfill('0') << i;
  }
  return out.str();
}

std::string repeated_alphabet(size_t length) {
  std::string text;
  for (size_t i = 0; i < length; ++i) {
    text.push_back(static_cast<char>('a' + (i % 26)));
  }
  return text;
}

}  // namespace

TEST(ChunkerTest, ShortTextIsSingleChunk) {
  Chunker chunker(50);

  auto chunks = chunker.chunk_all("Apples are red.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "Apples are red.");
  EXPECT_EQ(chunks[0].chunk_index, 0);
}

TEST(ChunkerTest, EmptyAndBlankTextYieldNothing) {
  Chunker chunker(50);

  EXPECT_TRUE(chunker.chunk_all("").empty());
  EXPECT_TRUE(chunker.chunk_all("   \n\n  \t").empty());
}

TEST(ChunkerTest, ChunksAreStripped) {
  Chunker chunker(50);

  auto chunks = chunker.chunk_all("\n\n  Bananas are yellow.  \n");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "Bananas are yellow.");
}

TEST(ChunkerTest, PrefersParagraphBoundaries) {
  const std::string first = "Apples are red and crunchy too.";
  const std::string second = "Bananas are yellow and soft ok.";
  Chunker chunker(50);

  auto chunks = chunker.chunk_all(first + "\n\n" + second);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].content, first);
  EXPECT_EQ(chunks[1].content, second);
}

TEST(ChunkerTest, HardCutsOverlapByExactlyForty) {
  const std::string text = repeated_alphabet(100);
  Chunker chunker(50);

  auto chunks = chunker.chunk_all(text);

  ASSERT_EQ(chunks.size(), 6u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].content, text.substr(i * 10, 50));
  }
  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].content.substr(10), chunks[i + 1].content.substr(0, 40));
  }
}

TEST(ChunkerTest, WordChunksRespectLimitAndShareTail) {
  const std::string text = numbered_words(30);
  Chunker chunker(50);

  auto chunks = chunker.chunk_all(text);

  ASSERT_GT(chunks.size(), 1u);
  for (const auto& chunk : chunks) {
    EXPECT_LE(Chunker::text_length(chunk.content), 50u);
    EXPECT_FALSE(chunk.content.empty());
  }

  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    const std::string& current = chunks[i].content;
    const std::string& next = chunks[i + 1].content;
    const std::string first_word = next.substr(0, next.find(' '));

    size_t pos = current.find(first_word);
    ASSERT_NE(pos, std::string::npos) << "chunk " << i + 1 << " does not overlap its predecessor";
    std::string tail = current.substr(pos);
    EXPECT_LE(tail.size(), 40u);
    EXPECT_EQ(next.substr(0, tail.size()), tail);
  }

  // Every word survives chunking
  for (int i = 0; i < 30; ++i) {
    std::ostringstream word;
    word << "word" << std::setw(2) << std::setfill('0') << i;
    bool found = false;
    for (const auto& chunk : chunks) {
      found = found || chunk.content.find(word.str()) != std::string::npos;
    }
    EXPECT_TRUE(found) << word.str();
  }
}

TEST(ChunkerTest, ChunkIndicesAreSequential) {
  Chunker chunker(50);

  auto chunks = chunker.chunk_all(numbered_words(40));

  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
  }
}

TEST(ChunkerTest, LengthIsMeasuredInCodePoints) {
  EXPECT_EQ(Chunker::text_length("h\xC3\xA9llo"), 5u);

  std::string accented;
  for (int i = 0; i < 60; ++i) {
    accented += "\xC3\xA9";
  }
  Chunker chunker(50);

  auto chunks = chunker.chunk_all(accented);

  ASSERT_GE(chunks.size(), 2u);
  EXPECT_EQ(Chunker::text_length(chunks[0].content), 50u);
  EXPECT_EQ(chunks[0].content.size(), 100u);
}

TEST(ChunkerTest, StreamIsLazyAndStaysExhausted) {
  Chunker chunker(50);
  ChunkStream stream = chunker.chunk(repeated_alphabet(100));

  int count = 0;
  while (auto chunk = stream.next()) {
    EXPECT_EQ(chunk->chunk_index, count);
    ++count;
  }

  EXPECT_EQ(count, 6);
  EXPECT_FALSE(stream.next().has_value());
}

TEST(ChunkerTest, RejectsInvalidLimits) {
  EXPECT_THROW(Chunker(0), std::invalid_argument);
  EXPECT_THROW(Chunker(40), std::invalid_argument);
  EXPECT_THROW(Chunker(30, 30), std::invalid_argument);
  EXPECT_NO_THROW(Chunker(10, 5));
}

TEST(ChunkerTest, FromConfigUsesEffectiveLength) {
  Chunker configured = Chunker::from_config(Config::from_json({{"index_text_chunk_len", 50}}));
  EXPECT_EQ(configured.limit(), 50u);
  EXPECT_EQ(configured.overlap(), Chunker::DEFAULT_OVERLAP);

  Chunker fallback = Chunker::from_config(
      Config::from_json({{"index_text_chunk_len", 0}, {"embedding_model_max_len", 256}}));
  EXPECT_EQ(fallback.limit(), 256u);
}

}  // namespace ragdex_core
