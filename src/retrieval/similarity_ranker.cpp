#include "chatraw/retrieval/similarity_ranker.hpp"
#include "chatraw/logger.hpp"
#include <algorithm>
#include <cmath>

namespace chatraw
{
namespace retrieval
{

SimilarityRanker::SimilarityRanker(const IChunkStore& store, RetrievalTuning tuning)
    : store_(store), tuning_(tuning)
{
}

std::vector<Candidate> SimilarityRanker::search(const std::vector<float>& query_vector, float threshold,
                                                size_t pool_size) const
{
    std::vector<Candidate> candidates;
    if (query_vector.empty() || pool_size == 0)
    {
        return candidates;
    }

    const size_t pageSize = static_cast<size_t>(std::max(1, tuning_.pageSize));
    const size_t maxCandidates = static_cast<size_t>(std::max(1, tuning_.maxCandidates));

    size_t scanned = 0;
    size_t skipped = 0;
    bool limitReached = false;

    for (size_t offset = 0; !limitReached; offset += pageSize)
    {
        const std::vector<Chunk> page = store_.listEmbeddedChunks(offset, pageSize);

        for (const auto& chunk : page)
        {
            ++scanned;
            if (!chunk.embedding || chunk.embedding->size() != query_vector.size())
            {
                ++skipped;
                continue;
            }

            const float score = cosineSimilarity(query_vector, *chunk.embedding);
            if (score >= threshold)
            {
                candidates.emplace_back(chunk.content, score);
                if (candidates.size() >= maxCandidates)
                {
                    limitReached = true;
                    break;
                }
            }
        }

        if (page.size() < pageSize)
        {
            break;
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    if (candidates.size() > pool_size)
    {
        candidates.resize(pool_size);
    }

    ServerLogger::logDebug("Similarity scan: %zu chunks scanned, %zu skipped for dimension, %zu candidates%s",
                           scanned, skipped, candidates.size(), limitReached ? " (limit reached)" : "");
    return candidates;
}

float SimilarityRanker::cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.empty() || b.empty() || a.size() != b.size())
    {
        return 0.0f;
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i)
    {
        dot_product += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0)
    {
        return 0.0f;
    }

    return static_cast<float>(dot_product / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

size_t SimilarityRanker::poolSizeFor(int top_k)
{
    return static_cast<size_t>(std::max(top_k * 2, 10));
}

} // namespace retrieval
} // namespace chatraw
