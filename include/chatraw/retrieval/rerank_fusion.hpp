#ifndef CHATRAW_RERANK_FUSION_HPP
#define CHATRAW_RERANK_FUSION_HPP

#include "../export.hpp"
#include "../http_client.hpp"
#include "../provider_config.hpp"
#include "candidate.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Optional second-stage scoring through a rerank provider
 *
 * Without a configured provider, or when the provider call fails, results are
 * the first top_k candidates in their embedding order.
 */
class CHATRAW_SERVER_API RerankFusion
{
public:
    RerankFusion(IHttpTransport& transport, ProviderConfig provider,
                 long connectTimeoutMs = 10000, long timeoutMs = 30000);

    bool isConfigured() const { return provider_.isConfigured(); }

    /**
     * @brief Pick the final top_k references from ranked candidates
     * @param query User query sent to the rerank provider
     * @param candidates Candidates sorted by descending cosine score
     * @param top_k Number of results
     */
    std::vector<Candidate> fuse(const std::string& query, const std::vector<Candidate>& candidates, int top_k);

    /**
     * @brief Rescore candidates through the provider
     * @return Candidates with rerank scores, unsorted; empty optional on any failure
     */
    std::optional<std::vector<Candidate>> rerank(const std::string& query, const std::vector<Candidate>& candidates);

private:
    IHttpTransport& transport_;
    ProviderConfig provider_;
    long connectTimeoutMs_;
    long timeoutMs_;
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_RERANK_FUSION_HPP
