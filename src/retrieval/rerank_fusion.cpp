#include "chatraw/retrieval/rerank_fusion.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/models/rerank_model.hpp"
#include <algorithm>

namespace chatraw
{
namespace retrieval
{

namespace
{

std::vector<Candidate> firstK(const std::vector<Candidate>& candidates, int top_k)
{
    const size_t count = std::min(candidates.size(), static_cast<size_t>(std::max(0, top_k)));
    return std::vector<Candidate>(candidates.begin(), candidates.begin() + count);
}

} // namespace

RerankFusion::RerankFusion(IHttpTransport& transport, ProviderConfig provider,
                           long connectTimeoutMs, long timeoutMs)
    : transport_(transport), provider_(std::move(provider)),
      connectTimeoutMs_(connectTimeoutMs), timeoutMs_(timeoutMs)
{
}

std::vector<Candidate> RerankFusion::fuse(const std::string& query, const std::vector<Candidate>& candidates, int top_k)
{
    if (!provider_.isConfigured() || candidates.empty())
    {
        return firstK(candidates, top_k);
    }

    auto reranked = rerank(query, candidates);
    if (!reranked || reranked->empty())
    {
        ServerLogger::logDebug("Rerank unavailable, keeping embedding scores");
        return firstK(candidates, top_k);
    }

    std::stable_sort(reranked->begin(), reranked->end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
    return firstK(*reranked, top_k);
}

std::optional<std::vector<Candidate>> RerankFusion::rerank(const std::string& query,
                                                           const std::vector<Candidate>& candidates)
{
    if (!provider_.isConfigured())
    {
        return std::nullopt;
    }

    RerankRequest payload;
    payload.model = provider_.modelId;
    payload.query = query;
    payload.return_documents = false;
    for (const auto& candidate : candidates)
    {
        payload.documents.push_back(candidate.content);
    }

    HttpRequest request;
    request.url = provider_.endpoint("/rerank");
    request.body = payload.to_json().dump();
    request.headers = jsonHeaders(provider_.apiKey);
    request.connectTimeoutMs = connectTimeoutMs_;
    request.timeoutMs = timeoutMs_;

    HttpResponse response = transport_.post(request);
    if (response.status != TransportStatus::Ok)
    {
        ServerLogger::logWarning("Rerank request failed: %s", response.error_message.c_str());
        return std::nullopt;
    }
    if (!response.ok())
    {
        ServerLogger::logWarning("Rerank API error (%ld): %s", response.status_code, response.body.c_str());
        return std::nullopt;
    }

    RerankResponse parsed;
    try
    {
        parsed.from_json(nlohmann::json::parse(response.body));
    }
    catch (const std::exception& ex)
    {
        ServerLogger::logWarning("Undecodable rerank response: %s", ex.what());
        return std::nullopt;
    }

    std::vector<Candidate> rescored;
    for (const auto& result : parsed.results)
    {
        if (result.index < 0 || static_cast<size_t>(result.index) >= candidates.size())
        {
            ServerLogger::logDebug("Ignoring rerank result with out-of-range index %d", result.index);
            continue;
        }
        rescored.emplace_back(candidates[static_cast<size_t>(result.index)].content, result.score);
    }
    return rescored;
}

} // namespace retrieval
} // namespace chatraw
