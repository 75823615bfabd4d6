#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cmath>

#include "chatraw/retrieval/chunk_store.hpp"
#include "chatraw/retrieval/similarity_ranker.hpp"
#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"

using chatraw::retrieval::Candidate;
using chatraw::retrieval::Chunk;
using chatraw::retrieval::InMemoryChunkStore;
using chatraw::retrieval::RetrievalTuning;
using chatraw::retrieval::SimilarityRanker;
using chatraw_tests::MockChunkStore;
using chatraw_tests::TestUtilities;

namespace {

class SimilarityRankerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    document_id_ = store_.saveDocument("notes.txt", "unused");
  }

  void addChunk(const std::string& content, std::vector<float> embedding) {
    store_.saveChunk(document_id_, content, std::move(embedding));
  }

  InMemoryChunkStore store_;
  std::string document_id_;
};

Chunk embeddedChunk(const std::string& content, std::vector<float> embedding) {
  Chunk chunk;
  chunk.content = content;
  chunk.embedding = std::move(embedding);
  return chunk;
}

} // namespace

TEST(CosineSimilarityTest, MatchesDefinition) {
  EXPECT_FLOAT_EQ(SimilarityRanker::cosineSimilarity({1, 0}, {1, 0}), 1.0f);
  EXPECT_FLOAT_EQ(SimilarityRanker::cosineSimilarity({1, 0}, {0, 1}), 0.0f);
  EXPECT_FLOAT_EQ(SimilarityRanker::cosineSimilarity({1, 0}, {-1, 0}), -1.0f);
  EXPECT_NEAR(SimilarityRanker::cosineSimilarity({1, 1}, {1, 0}), 1.0 / std::sqrt(2.0), 1e-6);
}

TEST(CosineSimilarityTest, DegenerateInputsScoreZero) {
  EXPECT_EQ(SimilarityRanker::cosineSimilarity({0, 0}, {1, 0}), 0.0f);
  EXPECT_EQ(SimilarityRanker::cosineSimilarity({1, 0}, {1, 0, 0}), 0.0f);
  EXPECT_EQ(SimilarityRanker::cosineSimilarity({}, {}), 0.0f);
}

TEST(CosineSimilarityTest, IsSymmetricAndBounded) {
  const std::vector<float> a = {0.3f, -1.2f, 4.5f, 0.01f};
  const std::vector<float> b = {2.0f, 0.7f, -0.4f, 9.0f};

  const float ab = SimilarityRanker::cosineSimilarity(a, b);
  EXPECT_FLOAT_EQ(ab, SimilarityRanker::cosineSimilarity(b, a));
  EXPECT_GE(ab, -1.0f);
  EXPECT_LE(ab, 1.0f);
}

TEST(PoolSizeTest, IsTwiceTopKWithFloorOfTen) {
  EXPECT_EQ(SimilarityRanker::poolSizeFor(3), 10u);
  EXPECT_EQ(SimilarityRanker::poolSizeFor(5), 10u);
  EXPECT_EQ(SimilarityRanker::poolSizeFor(8), 16u);
}

TEST_F(SimilarityRankerTest, RanksByDescendingScoreAboveThreshold) {
  addChunk("orthogonal", {0.0f, 1.0f});
  addChunk("exact", {1.0f, 0.0f});
  addChunk("close", {1.0f, 0.2f});
  addChunk("opposite", {-1.0f, 0.0f});

  SimilarityRanker ranker(store_, RetrievalTuning());
  auto results = ranker.search({1.0f, 0.0f}, 0.5f, 10);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].content, "exact");
  EXPECT_FLOAT_EQ(results[0].score, 1.0f);
  EXPECT_EQ(results[1].content, "close");
  EXPECT_GT(results[1].score, 0.5f);
}

TEST_F(SimilarityRankerTest, ThresholdIsInclusive) {
  addChunk("exact", {1.0f, 0.0f});

  SimilarityRanker ranker(store_, RetrievalTuning());

  EXPECT_EQ(ranker.search({1.0f, 0.0f}, 1.0f, 10).size(), 1u);
}

TEST_F(SimilarityRankerTest, SkipsMismatchedDimensionsAndUnembeddedChunks) {
  addChunk("wide", {1.0f, 0.0f, 0.0f});
  addChunk("bare", {});
  addChunk("match", {1.0f, 0.0f});

  SimilarityRanker ranker(store_, RetrievalTuning());
  auto results = ranker.search({1.0f, 0.0f}, 0.0f, 10);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].content, "match");
}

TEST_F(SimilarityRankerTest, TruncatesToPoolSize) {
  for (int i = 0; i < 12; ++i) {
    addChunk("chunk " + std::to_string(i), {1.0f, static_cast<float>(i) * 0.01f});
  }

  SimilarityRanker ranker(store_, RetrievalTuning());
  auto results = ranker.search({1.0f, 0.0f}, 0.0f, 4);

  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].content, "chunk 0");
  for (size_t i = 1; i < results.size(); ++i) {
    EXPECT_GE(results[i - 1].score, results[i].score);
  }
}

TEST_F(SimilarityRankerTest, EqualScoresKeepStorageOrder) {
  addChunk("first", {1.0f, 0.0f});
  addChunk("second", {2.0f, 0.0f});

  SimilarityRanker ranker(store_, RetrievalTuning());
  auto results = ranker.search({1.0f, 0.0f}, 0.0f, 10);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].content, "first");
  EXPECT_EQ(results[1].content, "second");
}

TEST_F(SimilarityRankerTest, EmptyQueryFindsNothing) {
  addChunk("exact", {1.0f, 0.0f});

  SimilarityRanker ranker(store_, RetrievalTuning());

  EXPECT_TRUE(ranker.search({}, 0.0f, 10).empty());
}

TEST(SimilarityRankerPagingTest, ReadsPagesUntilShortPage) {
  MockChunkStore store;
  RetrievalTuning tuning;
  tuning.pageSize = 2;

  testing::InSequence sequence;
  EXPECT_CALL(store, listEmbeddedChunks(0u, 2u))
      .WillOnce(testing::Return(std::vector<Chunk>{embeddedChunk("a", {1, 0}), embeddedChunk("b", {0, 1})}));
  EXPECT_CALL(store, listEmbeddedChunks(2u, 2u))
      .WillOnce(testing::Return(std::vector<Chunk>{embeddedChunk("c", {1, 1})}));

  SimilarityRanker ranker(store, tuning);
  auto results = ranker.search({1.0f, 0.0f}, 0.5f, 10);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].content, "a");
  EXPECT_EQ(results[1].content, "c");
}

TEST(SimilarityRankerPagingTest, StopsOnceCandidateLimitIsReached) {
  MockChunkStore store;
  RetrievalTuning tuning;
  tuning.pageSize = 2;
  tuning.maxCandidates = 3;

  EXPECT_CALL(store, listEmbeddedChunks(0u, 2u))
      .WillOnce(testing::Return(std::vector<Chunk>{embeddedChunk("a", {1, 0}), embeddedChunk("b", {1, 0})}));
  EXPECT_CALL(store, listEmbeddedChunks(2u, 2u))
      .WillOnce(testing::Return(std::vector<Chunk>{embeddedChunk("c", {1, 0}), embeddedChunk("d", {1, 0})}));
  EXPECT_CALL(store, listEmbeddedChunks(4u, 2u)).Times(0);

  SimilarityRanker ranker(store, tuning);
  auto results = ranker.search({1.0f, 0.0f}, 0.5f, 10);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[2].content, "c");
}
