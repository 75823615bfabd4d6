#ifndef CHATRAW_SIMILARITY_RANKER_HPP
#define CHATRAW_SIMILARITY_RANKER_HPP

#include "../export.hpp"
#include "candidate.hpp"
#include "chunk_store.hpp"
#include "retrieval_settings.hpp"
#include <vector>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Linear-scan cosine ranking of stored chunks against a query vector
 */
class CHATRAW_SERVER_API SimilarityRanker
{
public:
    explicit SimilarityRanker(const IChunkStore& store, RetrievalTuning tuning = RetrievalTuning());

    /**
     * @brief Rank stored chunks by cosine similarity to the query
     *
     * Chunks whose embedding dimension differs from the query are skipped.
     * The scan stops as soon as max_candidates chunks reached the threshold,
     * so later chunks are not considered even if they would score higher.
     *
     * @param query_vector Query embedding
     * @param threshold Minimum similarity kept
     * @param pool_size Maximum number of candidates returned
     * @return Candidates sorted by descending score
     */
    std::vector<Candidate> search(const std::vector<float>& query_vector, float threshold, size_t pool_size) const;

    /**
     * @brief Cosine similarity, 0 for empty, zero-norm or mismatched vectors
     */
    static float cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

    // Number of candidates handed to reranking for a given top_k
    static size_t poolSizeFor(int top_k);

private:
    const IChunkStore& store_;
    RetrievalTuning tuning_;
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_SIMILARITY_RANKER_HPP
