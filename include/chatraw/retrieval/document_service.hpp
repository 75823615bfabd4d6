#ifndef CHATRAW_DOCUMENT_SERVICE_HPP
#define CHATRAW_DOCUMENT_SERVICE_HPP

#include "../export.hpp"
#include "chunk_store.hpp"
#include "document_types.hpp"
#include "embedding_client.hpp"
#include "retrieval_settings.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Receives ingestion progress events:
 * {"status":"chunking","total":N}, {"status":"embedding","progress":P,"current":i,"total":N}
 * once per chunk, and {"status":"done","filename":...}
 */
using ProgressSink = std::function<void(const nlohmann::json& event)>;

/**
 * @brief Ingests documents into the chunk store
 *
 * Documents are chunked, embedded in batches and stored chunk by chunk. A
 * chunk whose embedding failed is still stored, without an embedding, so it
 * never takes part in similarity search.
 */
class CHATRAW_SERVER_API DocumentService
{
public:
    DocumentService(IChunkStore& store, EmbeddingClient& embeddings, RetrievalTuning tuning = RetrievalTuning());

    DocumentService(const DocumentService&) = delete;
    DocumentService& operator=(const DocumentService&) = delete;

    IngestResult ingest(const std::string& filename, const std::string& text,
                        const RetrievalSettings& settings, const ProgressSink& progress = nullptr);

    bool remove(const std::string& document_id);

    std::vector<DocumentSummary> list() const;

private:
    IChunkStore& store_;
    EmbeddingClient& embeddings_;
    RetrievalTuning tuning_;
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_DOCUMENT_SERVICE_HPP
