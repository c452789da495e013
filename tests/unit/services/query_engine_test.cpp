#include "ragdex_core/services/query_engine.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace ragdex_core {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ragdex_tests::KeywordEmbeddingClient;
using ragdex_tests::MockLlamafileClient;
using ragdex_tests::TestUtilities;

namespace {

const std::string kPromptHeader =
    "You are an expert Q&A system. Answer the user's query using the provided context "
    "information.\nContext information:\n";

}  // namespace

class QueryEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<KeywordEmbeddingClient>();
    Embedder embedder(client_);
    index_ = std::make_unique<VectorIndex>(KeywordEmbeddingClient::DIMENSION);
    for (const std::string text :
         {"Apples are red.", "Bananas are yellow.", "Grapes are purple."}) {
      index_->add(embedder.embed(text), text);
    }
    engine_ = std::make_unique<QueryEngine>(*index_, client_, out_);
  }

  std::shared_ptr<KeywordEmbeddingClient> client_;
  std::unique_ptr<VectorIndex> index_;
  std::ostringstream out_;
  std::unique_ptr<QueryEngine> engine_;
};

TEST_F(QueryEngineTest, AnswerReturnsBestMatchFirst) {
  QueryOutcome outcome = engine_->answer("What color are apples?", 3);

  ASSERT_EQ(outcome.hits.size(), 3u);
  EXPECT_EQ(outcome.hits[0].text, "Apples are red.");
  EXPECT_GT(outcome.hits[0].score, outcome.hits[1].score);
  EXPECT_EQ(outcome.answer, "stub answer");
}

TEST_F(QueryEngineTest, PromptFollowsTemplate) {
  QueryOutcome outcome = engine_->answer("What color are apples?", 1);

  EXPECT_EQ(outcome.prompt, kPromptHeader + "Apples are red.\nQuery: What color are apples?");
  ASSERT_EQ(client_->prompts().size(), 1u);
  EXPECT_EQ(client_->prompts()[0], outcome.prompt);
  EXPECT_EQ(outcome.prompt_tokens, client_->tokenize(outcome.prompt).size());
}

TEST_F(QueryEngineTest, PrintsSectionsInOrder) {
  QueryOutcome outcome = engine_->answer("What color are apples?", 1);
  const std::string output = out_.str();

  const size_t query_pos = output.find("=== Query ===\nWhat color are apples?\n\n");
  const size_t results_pos = output.find("=== Search Results ===\n0.5774 - \"Apples are red.\"\n");
  const size_t prompt_pos = output.find("=== Prompt ===\n\"" + outcome.prompt + "\"\n");
  const size_t tokens_pos =
      output.find("(prompt_ntokens: " + std::to_string(outcome.prompt_tokens) + ")\n");
  const size_t answer_pos = output.find("=== Answer ===\n\"stub answer\"\n\n");
  const size_t separator_pos = output.find(std::string(80, '-'));

  ASSERT_NE(query_pos, std::string::npos);
  ASSERT_NE(results_pos, std::string::npos);
  ASSERT_NE(prompt_pos, std::string::npos);
  ASSERT_NE(tokens_pos, std::string::npos);
  ASSERT_NE(answer_pos, std::string::npos);
  ASSERT_NE(separator_pos, std::string::npos);
  EXPECT_LT(query_pos, results_pos);
  EXPECT_LT(results_pos, prompt_pos);
  EXPECT_LT(prompt_pos, tokens_pos);
  EXPECT_LT(tokens_pos, answer_pos);
  EXPECT_LT(answer_pos, separator_pos);
}

TEST_F(QueryEngineTest, ContextJoinsHitsWithNewlines) {
  std::vector<SearchHit> hits = {{0, 0.9f, "first chunk"}, {4, 0.5f, "second chunk"}};

  EXPECT_EQ(QueryEngine::build_prompt(hits, "q"),
            kPromptHeader + "first chunk\nsecond chunk\nQuery: q");
}

TEST_F(QueryEngineTest, PreviewTruncatesByCodePoint) {
  EXPECT_EQ(QueryEngine::preview(std::string(150, 'x')), std::string(100, 'x'));
  EXPECT_EQ(QueryEngine::preview("short"), "short");
  EXPECT_EQ(QueryEngine::preview("\xC3\xA9\xC3\xA9\xC3\xA9", 2), "\xC3\xA9\xC3\xA9");
}

TEST_F(QueryEngineTest, RunAnswersUntilEndOfInput) {
  std::istringstream in("What color are apples?\n\n   \nWhich fruit is yellow?\n");

  size_t answered = engine_->run(in, 1);

  EXPECT_EQ(answered, 2u);
  EXPECT_EQ(client_->prompts().size(), 2u);
  EXPECT_THAT(out_.str(), HasSubstr("Enter query (ctrl-d to quit):> "));
}

TEST_F(QueryEngineTest, RunWithNoInputAnswersNothing) {
  std::istringstream in("");

  EXPECT_EQ(engine_->run(in), 0u);
  EXPECT_TRUE(client_->prompts().empty());
}

TEST(QueryEngineEmptyIndexTest, ReportsNoResultsAndEmptyContext) {
  auto client = std::make_shared<KeywordEmbeddingClient>();
  VectorIndex index(KeywordEmbeddingClient::DIMENSION);
  std::ostringstream out;
  QueryEngine engine(index, client, out);

  QueryOutcome outcome = engine.answer("anything at all?");

  EXPECT_TRUE(outcome.hits.empty());
  EXPECT_THAT(out.str(), HasSubstr("=== Search Results ===\nNo results found.\n"));
  EXPECT_EQ(outcome.prompt, kPromptHeader + "\nQuery: anything at all?");
}

class QueryEngineFailureTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockLlamafileClient>>();
    index_ = std::make_unique<VectorIndex>(8);
    std::vector<float> stored(8, 0.1f);
    stored[0] = 0.5f;
    index_->add(TestUtilities::normalized(stored), "stored chunk");
    engine_ = std::make_unique<QueryEngine>(*index_, client_, out_);
  }

  std::shared_ptr<NiceMock<MockLlamafileClient>> client_;
  std::unique_ptr<VectorIndex> index_;
  std::ostringstream out_;
  std::unique_ptr<QueryEngine> engine_;
};

TEST_F(QueryEngineFailureTest, EmbeddingFailureEndsOnlyThatTurn) {
  std::vector<float> good(8, 0.1f);
  good[0] = 0.5f;
  EXPECT_CALL(*client_, embed(_))
      .WillOnce(Throw(ModelServiceError("embedding server down")))
      .WillOnce(Return(good));
  std::istringstream in("first\nsecond\n");

  size_t answered = engine_->run(in);

  EXPECT_EQ(answered, 1u);
  EXPECT_THAT(out_.str(), HasSubstr("Error: "));
  EXPECT_THAT(out_.str(), HasSubstr("embedding server down"));
  EXPECT_THAT(out_.str(), HasSubstr("\"answer\""));
}

TEST_F(QueryEngineFailureTest, CompletionFailureEndsOnlyThatTurn) {
  EXPECT_CALL(*client_, completion(_))
      .WillOnce(Throw(ModelServiceError("generation timed out")))
      .WillOnce(Return(std::string("second answer")));
  std::istringstream in("first\nsecond\n");

  size_t answered = engine_->run(in);

  EXPECT_EQ(answered, 1u);
  EXPECT_THAT(out_.str(), HasSubstr("generation timed out"));
  EXPECT_THAT(out_.str(), HasSubstr("\"second answer\""));
}

TEST_F(QueryEngineFailureTest, DimensionMismatchEndsSession) {
  EXPECT_CALL(*client_, embed(_)).WillOnce(Return(std::vector<float>(5, 1.0f)));
  std::istringstream in("first\nsecond\n");

  EXPECT_THROW(engine_->run(in), DimensionMismatchError);
}

TEST_F(QueryEngineFailureTest, ScoreIsPrintedWithFourDecimals) {
  engine_->answer("anything", 1);

  EXPECT_THAT(out_.str(), HasSubstr("1.0000 - \"stored chunk\""));
}

}  // namespace ragdex_core
