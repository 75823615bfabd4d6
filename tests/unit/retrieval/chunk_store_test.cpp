#include <gtest/gtest.h>

#include <stdexcept>

#include "chatraw/retrieval/chunk_store.hpp"

using chatraw::retrieval::InMemoryChunkStore;

TEST(InMemoryChunkStoreTest, ListsOnlyEmbeddedChunksInPages) {
  InMemoryChunkStore store;
  const std::string doc = store.saveDocument("a.txt", "body");
  store.saveChunk(doc, "one", std::vector<float>{1.0f});
  store.saveChunk(doc, "skipped", std::nullopt);
  store.saveChunk(doc, "two", std::vector<float>{2.0f});
  store.saveChunk(doc, "three", std::vector<float>{3.0f});

  auto first = store.listEmbeddedChunks(0, 2);
  auto second = store.listEmbeddedChunks(2, 2);

  ASSERT_EQ(first.size(), 2u);
  EXPECT_EQ(first[0].content, "one");
  EXPECT_EQ(first[1].content, "two");
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].content, "three");
  EXPECT_TRUE(store.listEmbeddedChunks(3, 2).empty());
  EXPECT_TRUE(store.listEmbeddedChunks(0, 0).empty());
}

TEST(InMemoryChunkStoreTest, EmptyEmbeddingIsStoredAsAbsent) {
  InMemoryChunkStore store;
  const std::string doc = store.saveDocument("a.txt", "body");
  store.saveChunk(doc, "bare", std::vector<float>{});

  EXPECT_TRUE(store.listEmbeddedChunks(0, 10).empty());
  ASSERT_EQ(store.listDocuments().size(), 1u);
  EXPECT_EQ(store.listDocuments()[0].chunkCount, 1u);
}

TEST(InMemoryChunkStoreTest, RejectsChunksOfUnknownDocuments) {
  InMemoryChunkStore store;

  EXPECT_THROW(store.saveChunk("missing", "text", std::nullopt), std::invalid_argument);
}

TEST(InMemoryChunkStoreTest, BackfillsEmbeddings) {
  InMemoryChunkStore store;
  const std::string doc = store.saveDocument("a.txt", "body");
  const std::string chunk = store.saveChunk(doc, "late", std::nullopt);

  EXPECT_TRUE(store.setChunkEmbedding(chunk, {0.5f, 0.5f}));
  EXPECT_FALSE(store.setChunkEmbedding("missing", {1.0f}));

  auto embedded = store.listEmbeddedChunks(0, 10);
  ASSERT_EQ(embedded.size(), 1u);
  EXPECT_EQ(embedded[0].id, chunk);
  EXPECT_EQ(embedded[0].documentId, doc);
  EXPECT_EQ(*embedded[0].embedding, (std::vector<float>{0.5f, 0.5f}));
}

TEST(InMemoryChunkStoreTest, DeletingDocumentRemovesItsChunks) {
  InMemoryChunkStore store;
  const std::string keep = store.saveDocument("keep.txt", "k");
  const std::string drop = store.saveDocument("drop.txt", "d");
  store.saveChunk(keep, "kept", std::vector<float>{1.0f});
  store.saveChunk(drop, "dropped", std::vector<float>{1.0f});

  EXPECT_TRUE(store.deleteDocument(drop));
  EXPECT_FALSE(store.deleteDocument(drop));

  auto chunks = store.listEmbeddedChunks(0, 10);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "kept");
  ASSERT_EQ(store.listDocuments().size(), 1u);
  EXPECT_EQ(store.listDocuments()[0].filename, "keep.txt");
}

TEST(InMemoryChunkStoreTest, ListsNewestDocumentFirst) {
  InMemoryChunkStore store;
  store.saveDocument("old.txt", "o");
  const std::string newest = store.saveDocument("new.txt", "n");

  auto documents = store.listDocuments();

  ASSERT_EQ(documents.size(), 2u);
  EXPECT_EQ(documents[0].id, newest);
  EXPECT_EQ(documents[0].to_json()["filename"], "new.txt");
  EXPECT_EQ(documents[0].to_json()["chunks"], 0);
  EXPECT_FALSE(documents[0].createdAt.empty());
}
