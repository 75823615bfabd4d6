#include "chatraw/retrieval/chunk_store.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/store_utils.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace chatraw
{
namespace retrieval
{

nlohmann::json DocumentSummary::to_json() const
{
    nlohmann::json j;
    j["id"] = id;
    j["filename"] = filename;
    j["created_at"] = createdAt;
    j["chunks"] = chunkCount;
    return j;
}

std::string InMemoryChunkStore::saveDocument(const std::string& filename, const std::string& content)
{
    Document document{generateUuid(), filename, content, currentIsoTimestamp()};

    std::unique_lock<std::shared_mutex> lock(mutex_);
    documents_.push_back(document);
    return document.id;
}

std::string InMemoryChunkStore::saveChunk(const std::string& documentId, const std::string& content,
                                          std::optional<std::vector<float>> embedding)
{
    Chunk chunk;
    chunk.id = generateUuid();
    chunk.documentId = documentId;
    chunk.content = content;
    if (embedding && !embedding->empty())
    {
        chunk.embedding = std::move(embedding);
    }
    chunk.createdAt = currentIsoTimestamp();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const bool documentExists = std::any_of(documents_.begin(), documents_.end(),
                                            [&documentId](const Document& d) { return d.id == documentId; });
    if (!documentExists)
    {
        throw std::invalid_argument("Unknown document: " + documentId);
    }

    chunks_.push_back(std::move(chunk));
    return chunks_.back().id;
}

bool InMemoryChunkStore::setChunkEmbedding(const std::string& chunkId, std::vector<float> embedding)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = std::find_if(chunks_.begin(), chunks_.end(), [&chunkId](const Chunk& c) { return c.id == chunkId; });
    if (it == chunks_.end())
    {
        return false;
    }

    if (embedding.empty())
    {
        it->embedding.reset();
    }
    else
    {
        it->embedding = std::move(embedding);
    }
    return true;
}

std::vector<Chunk> InMemoryChunkStore::listEmbeddedChunks(size_t offset, size_t limit) const
{
    std::vector<Chunk> page;
    if (limit == 0)
    {
        return page;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t skipped = 0;
    for (const auto& chunk : chunks_)
    {
        if (!chunk.embedding)
        {
            continue;
        }
        if (skipped < offset)
        {
            ++skipped;
            continue;
        }
        page.push_back(chunk);
        if (page.size() == limit)
        {
            break;
        }
    }
    return page;
}

std::vector<DocumentSummary> InMemoryChunkStore::listDocuments() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<DocumentSummary> summaries;
    summaries.reserve(documents_.size());
    for (auto it = documents_.rbegin(); it != documents_.rend(); ++it)
    {
        DocumentSummary summary;
        summary.id = it->id;
        summary.filename = it->filename;
        summary.createdAt = it->createdAt;
        summary.chunkCount = static_cast<size_t>(std::count_if(
            chunks_.begin(), chunks_.end(), [&it](const Chunk& c) { return c.documentId == it->id; }));
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

bool InMemoryChunkStore::deleteDocument(const std::string& documentId)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto docIt = std::find_if(documents_.begin(), documents_.end(),
                              [&documentId](const Document& d) { return d.id == documentId; });
    if (docIt == documents_.end())
    {
        return false;
    }
    documents_.erase(docIt);

    const size_t before = chunks_.size();
    chunks_.erase(std::remove_if(chunks_.begin(), chunks_.end(),
                                 [&documentId](const Chunk& c) { return c.documentId == documentId; }),
                  chunks_.end());

    ServerLogger::logDebug("Deleted document %s with %zu chunks", documentId.c_str(), before - chunks_.size());
    return true;
}

} // namespace retrieval
} // namespace chatraw
