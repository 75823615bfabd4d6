#pragma once

#include <gmock/gmock.h>

#include "chatraw/http_client.hpp"
#include "chatraw/retrieval/chunk_store.hpp"

namespace chatraw_tests {

/**
 * Mock transport for tests that only care whether and how a provider is called
 */
class MockHttpTransport : public chatraw::IHttpTransport {
 public:
  MOCK_METHOD(chatraw::HttpResponse, post, (const chatraw::HttpRequest& request), (override));
  MOCK_METHOD(chatraw::HttpResponse, postStream,
              (const chatraw::HttpRequest& request, const chatraw::StreamDataCallback& onData), (override));
};

/**
 * Mock chunk store for observing how the ranker pages through stored chunks
 */
class MockChunkStore : public chatraw::retrieval::IChunkStore {
 public:
  MOCK_METHOD(std::string, saveDocument, (const std::string& filename, const std::string& content), (override));
  MOCK_METHOD(std::string, saveChunk,
              (const std::string& documentId, const std::string& content,
               std::optional<std::vector<float>> embedding),
              (override));
  MOCK_METHOD(bool, setChunkEmbedding, (const std::string& chunkId, std::vector<float> embedding), (override));
  MOCK_METHOD(std::vector<chatraw::retrieval::Chunk>, listEmbeddedChunks, (size_t offset, size_t limit),
              (const, override));
  MOCK_METHOD(std::vector<chatraw::retrieval::DocumentSummary>, listDocuments, (), (const, override));
  MOCK_METHOD(bool, deleteDocument, (const std::string& documentId), (override));
};

} // namespace chatraw_tests
