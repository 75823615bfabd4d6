#ifndef CHATRAW_RETRIEVAL_SETTINGS_HPP
#define CHATRAW_RETRIEVAL_SETTINGS_HPP

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Per-call retrieval parameters
 */
struct RetrievalSettings
{
    int chunkSize = 500;               // Maximum chunk length in code points
    int chunkOverlap = 50;             // Code points carried from one chunk into the next
    int topK = 3;                      // Number of references handed to the model
    float scoreThreshold = 0.5f;       // Minimum cosine similarity for a candidate
};

/**
 * @brief Store scan and batching limits
 */
struct RetrievalTuning
{
    int pageSize = 200;                // Chunks read from the store per page
    int maxCandidates = 50;            // Scan stops once this many candidates qualify
    int embeddingBatchSize = 16;       // Texts per embedding request during ingestion
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_RETRIEVAL_SETTINGS_HPP
