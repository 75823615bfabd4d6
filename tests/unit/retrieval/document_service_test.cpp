#include <gtest/gtest.h>

#include "chatraw/retrieval/chunk_store.hpp"
#include "chatraw/retrieval/document_service.hpp"
#include "common/utilities_test.hpp"

using chatraw::retrieval::DocumentService;
using chatraw::retrieval::EmbeddingClient;
using chatraw::retrieval::InMemoryChunkStore;
using chatraw::retrieval::RetrievalSettings;
using chatraw::retrieval::RetrievalTuning;
using chatraw_tests::FakeHttpTransport;
using chatraw_tests::TestUtilities;

namespace {

RetrievalSettings smallChunks() {
  RetrievalSettings settings;
  settings.chunkSize = 8;
  settings.chunkOverlap = 0;
  return settings;
}

} // namespace

TEST(DocumentServiceTest, IngestReportsProgressAndStoresEmbeddings) {
  FakeHttpTransport transport;
  transport.script("/embeddings", TestUtilities::json(TestUtilities::embeddingBody({{1.0f, 0.0f}, {0.0f, 1.0f}})));
  transport.script("/embeddings", TestUtilities::json(TestUtilities::embeddingBody({{0.5f, 0.5f}})));

  InMemoryChunkStore store;
  EmbeddingClient embeddings(transport, TestUtilities::provider("embedder"));
  RetrievalTuning tuning;
  tuning.embeddingBatchSize = 2;
  DocumentService service(store, embeddings, tuning);

  std::vector<nlohmann::json> events;
  auto result = service.ingest("notes.txt", "aaaa\n\nbbbb\n\ncccc", smallChunks(),
                               [&events](const nlohmann::json& event) { events.push_back(event); });

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.chunk_count, 3u);
  EXPECT_EQ(result.embedded_count, 3u);
  EXPECT_EQ(transport.callsTo("/embeddings"), 2u);

  ASSERT_EQ(events.size(), 5u);
  EXPECT_EQ(events[0], (nlohmann::json{{"status", "chunking"}, {"total", 3}}));
  EXPECT_EQ(events[1], (nlohmann::json{{"status", "embedding"}, {"progress", 33}, {"current", 1}, {"total", 3}}));
  EXPECT_EQ(events[2]["progress"], 66);
  EXPECT_EQ(events[3]["progress"], 100);
  EXPECT_EQ(events[4], (nlohmann::json{{"status", "done"}, {"filename", "notes.txt"}}));

  auto chunks = store.listEmbeddedChunks(0, 10);
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, "aaaa");
  EXPECT_EQ(chunks[2].content, "cccc");
  EXPECT_EQ(*chunks[2].embedding, (std::vector<float>{0.5f, 0.5f}));
  EXPECT_EQ(chunks[0].documentId, result.document_id);
}

TEST(DocumentServiceTest, FailedEmbeddingsStoreChunksWithoutVectors) {
  FakeHttpTransport transport;
  transport.script("/embeddings", TestUtilities::httpError(500, "down"));

  InMemoryChunkStore store;
  EmbeddingClient embeddings(transport, TestUtilities::provider("embedder"));
  DocumentService service(store, embeddings);

  auto result = service.ingest("notes.txt", "aaaa\n\nbbbb", smallChunks());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.chunk_count, 2u);
  EXPECT_EQ(result.embedded_count, 0u);
  EXPECT_TRUE(store.listEmbeddedChunks(0, 10).empty());
  ASSERT_EQ(service.list().size(), 1u);
  EXPECT_EQ(service.list()[0].chunkCount, 2u);
}

TEST(DocumentServiceTest, UnconfiguredEmbeddingsStillIngest) {
  FakeHttpTransport transport;
  InMemoryChunkStore store;
  EmbeddingClient embeddings(transport, chatraw::ProviderConfig());
  DocumentService service(store, embeddings);

  auto result = service.ingest("notes.txt", "hello world", RetrievalSettings());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.chunk_count, 1u);
  EXPECT_TRUE(transport.requests().empty());
}

TEST(DocumentServiceTest, InvalidChunkSizeFailsWithoutStoring) {
  FakeHttpTransport transport;
  InMemoryChunkStore store;
  EmbeddingClient embeddings(transport, chatraw::ProviderConfig());
  DocumentService service(store, embeddings);

  RetrievalSettings settings;
  settings.chunkSize = 0;
  auto result = service.ingest("notes.txt", "hello", settings);

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
  EXPECT_EQ(result.to_json()["success"], false);
  EXPECT_TRUE(result.to_json().contains("error"));
  EXPECT_TRUE(service.list().empty());
}

TEST(DocumentServiceTest, RemoveDeletesDocumentAndChunks) {
  FakeHttpTransport transport;
  transport.script("/embeddings", TestUtilities::json(TestUtilities::embeddingBody({{1.0f}})));

  InMemoryChunkStore store;
  EmbeddingClient embeddings(transport, TestUtilities::provider("embedder"));
  DocumentService service(store, embeddings);

  auto result = service.ingest("notes.txt", "short", RetrievalSettings());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.to_json()["chunks"], 1);

  EXPECT_TRUE(service.remove(result.document_id));
  EXPECT_FALSE(service.remove(result.document_id));
  EXPECT_TRUE(service.list().empty());
  EXPECT_TRUE(store.listEmbeddedChunks(0, 10).empty());
}

TEST(UploadDocumentRequestTest, RequiresFilenameAndContent) {
  chatraw::retrieval::UploadDocumentRequest request;

  EXPECT_THROW(request.from_json({{"filename", "a.txt"}}), std::runtime_error);
  EXPECT_THROW(request.from_json({{"content", "text"}}), std::runtime_error);

  request.from_json({{"filename", ""}, {"content", "text"}});
  EXPECT_FALSE(request.validate());

  request.from_json({{"filename", "a.txt"}, {"content", "text"}});
  EXPECT_TRUE(request.validate());
  EXPECT_EQ(request.content, "text");
}

TEST(DocumentServiceTest, DocumentRemovedDuringIngestStopsWithError) {
  FakeHttpTransport transport;
  InMemoryChunkStore store;
  EmbeddingClient embeddings(transport, chatraw::ProviderConfig());
  DocumentService service(store, embeddings);

  std::vector<nlohmann::json> events;
  auto result = service.ingest("gone.txt", "aaaa\n\nbbbb", smallChunks(),
                               [&](const nlohmann::json& event) {
                                 events.push_back(event);
                                 if (event["status"] == "chunking") {
                                   service.remove(service.list().at(0).id);
                                 }
                               });

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.error_message.empty());
  EXPECT_EQ(result.to_json()["success"], false);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0]["status"], "chunking");
  EXPECT_TRUE(service.list().empty());
}
