#include "chatraw/retrieval/document_service.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/retrieval/chunker.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace chatraw
{
namespace retrieval
{

DocumentService::DocumentService(IChunkStore& store, EmbeddingClient& embeddings, RetrievalTuning tuning)
    : store_(store), embeddings_(embeddings), tuning_(tuning)
{
}

IngestResult DocumentService::ingest(const std::string& filename, const std::string& text,
                                     const RetrievalSettings& settings, const ProgressSink& progress)
{
    IngestResult result;

    auto report = [&progress](const nlohmann::json& event) {
        if (progress)
        {
            progress(event);
        }
    };

    std::vector<std::string> chunks;
    try
    {
        chunks = Chunker::chunk(text, settings.chunkSize, settings.chunkOverlap);
    }
    catch (const std::invalid_argument& ex)
    {
        result.error_message = ex.what();
        ServerLogger::logError("Cannot ingest %s: %s", filename.c_str(), ex.what());
        return result;
    }

    result.document_id = store_.saveDocument(filename, text);
    result.chunk_count = chunks.size();

    const size_t total = chunks.size();
    report({{"status", "chunking"}, {"total", total}});

    if (!embeddings_.isConfigured())
    {
        ServerLogger::logWarning("No embedding provider configured, chunks of %s are stored without embeddings",
                                 filename.c_str());
    }

    const size_t batchSize = static_cast<size_t>(std::max(1, tuning_.embeddingBatchSize));

    for (size_t start = 0; start < total; start += batchSize)
    {
        const size_t end = std::min(start + batchSize, total);
        std::vector<std::string> batch(chunks.begin() + start, chunks.begin() + end);
        std::vector<std::vector<float>> vectors = embeddings_.embedBatch(batch, static_cast<int>(batch.size()));

        for (size_t i = 0; i < batch.size(); ++i)
        {
            std::optional<std::vector<float>> embedding;
            if (!vectors[i].empty())
            {
                embedding = std::move(vectors[i]);
                ++result.embedded_count;
            }
            try
            {
                store_.saveChunk(result.document_id, batch[i], std::move(embedding));
            }
            catch (const std::invalid_argument& ex)
            {
                // The document was deleted while its chunks were still being stored
                result.error_message = ex.what();
                ServerLogger::logWarning("Stopped ingesting %s: %s", filename.c_str(), ex.what());
                return result;
            }

            const size_t current = start + i + 1;
            const int percent = static_cast<int>(current * 100 / total);
            report({{"status", "embedding"}, {"progress", percent}, {"current", current}, {"total", total}});
        }
    }

    report({{"status", "done"}, {"filename", filename}});

    result.success = true;
    ServerLogger::logInfo("Ingested %s: %zu chunks, %zu embedded", filename.c_str(), result.chunk_count,
                          result.embedded_count);
    return result;
}

bool DocumentService::remove(const std::string& document_id)
{
    const bool removed = store_.deleteDocument(document_id);
    if (removed)
    {
        ServerLogger::logInfo("Removed document %s", document_id.c_str());
    }
    return removed;
}

std::vector<DocumentSummary> DocumentService::list() const
{
    return store_.listDocuments();
}

} // namespace retrieval
} // namespace chatraw
