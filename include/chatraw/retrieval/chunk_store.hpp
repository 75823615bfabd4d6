#ifndef CHATRAW_CHUNK_STORE_HPP
#define CHATRAW_CHUNK_STORE_HPP

#include "../export.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace chatraw
{
namespace retrieval
{

struct Chunk
{
    std::string id;
    std::string documentId;
    std::string content;
    std::optional<std::vector<float>> embedding;   // Absent when embedding failed at ingestion
    std::string createdAt;
};

struct DocumentSummary
{
    std::string id;
    std::string filename;
    std::string createdAt;
    size_t chunkCount = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Storage for ingested documents and their chunks
 *
 * Chunks are immutable once saved except for setChunkEmbedding, and are
 * removed together with their document.
 */
class CHATRAW_SERVER_API IChunkStore
{
public:
    virtual ~IChunkStore() = default;

    /**
     * @brief Store a document
     * @return Identifier of the new document
     */
    virtual std::string saveDocument(const std::string& filename, const std::string& content) = 0;

    /**
     * @brief Store a chunk of an existing document
     *
     * An empty embedding is stored as absent.
     * @throws std::invalid_argument if the document does not exist
     */
    virtual std::string saveChunk(const std::string& documentId, const std::string& content,
                                  std::optional<std::vector<float>> embedding) = 0;

    // Backfills the embedding of a chunk; false when the chunk does not exist
    virtual bool setChunkEmbedding(const std::string& chunkId, std::vector<float> embedding) = 0;

    /**
     * @brief Page through chunks that carry an embedding
     * @param offset Number of embedded chunks to skip
     * @param limit Maximum number of chunks returned
     * @return Chunks in storage order; fewer than limit means the end was reached
     */
    virtual std::vector<Chunk> listEmbeddedChunks(size_t offset, size_t limit) const = 0;

    // Newest first
    virtual std::vector<DocumentSummary> listDocuments() const = 0;

    virtual bool deleteDocument(const std::string& documentId) = 0;
};

/**
 * @brief Thread-safe in-process chunk store
 */
class CHATRAW_SERVER_API InMemoryChunkStore : public IChunkStore
{
public:
    std::string saveDocument(const std::string& filename, const std::string& content) override;
    std::string saveChunk(const std::string& documentId, const std::string& content,
                          std::optional<std::vector<float>> embedding) override;
    bool setChunkEmbedding(const std::string& chunkId, std::vector<float> embedding) override;
    std::vector<Chunk> listEmbeddedChunks(size_t offset, size_t limit) const override;
    std::vector<DocumentSummary> listDocuments() const override;
    bool deleteDocument(const std::string& documentId) override;

private:
    struct Document
    {
        std::string id;
        std::string filename;
        std::string content;
        std::string createdAt;
    };

    mutable std::shared_mutex mutex_;
    std::vector<Document> documents_;
    std::vector<Chunk> chunks_;
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_CHUNK_STORE_HPP
