#include "chatraw/retrieval/embedding_client.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/models/embedding_model.hpp"
#include <algorithm>

namespace chatraw
{
namespace retrieval
{

EmbeddingClient::EmbeddingClient(IHttpTransport& transport, ProviderConfig provider,
                                 long connectTimeoutMs, long timeoutMs)
    : transport_(transport), provider_(std::move(provider)),
      connectTimeoutMs_(connectTimeoutMs), timeoutMs_(timeoutMs)
{
}

std::vector<std::vector<float>> EmbeddingClient::embedBatch(const std::vector<std::string>& texts, int batch_size)
{
    std::vector<std::vector<float>> vectors(texts.size());

    if (texts.empty())
    {
        return vectors;
    }

    if (!provider_.isConfigured())
    {
        ServerLogger::logDebug("Embedding provider not configured, returning %zu empty vectors", texts.size());
        return vectors;
    }

    const size_t groupSize = static_cast<size_t>(std::max(1, batch_size));

    for (size_t offset = 0; offset < texts.size(); offset += groupSize)
    {
        const size_t end = std::min(offset + groupSize, texts.size());
        std::vector<std::string> group(texts.begin() + offset, texts.begin() + end);
        embedGroup(group, offset, vectors);
    }

    return vectors;
}

std::vector<float> EmbeddingClient::embedOne(const std::string& text)
{
    return embedBatch({text}, 1)[0];
}

void EmbeddingClient::embedGroup(const std::vector<std::string>& group, size_t offset,
                                 std::vector<std::vector<float>>& out)
{
    EmbeddingRequest payload;
    payload.model = provider_.modelId;
    payload.input = group;

    HttpRequest request;
    request.url = provider_.endpoint("/embeddings");
    request.body = payload.to_json().dump();
    request.headers = jsonHeaders(provider_.apiKey);
    request.connectTimeoutMs = connectTimeoutMs_;
    request.timeoutMs = timeoutMs_;

    HttpResponse response = transport_.post(request);

    if (response.status != TransportStatus::Ok)
    {
        ServerLogger::logWarning("Embedding request for %zu texts failed: %s",
                                 group.size(), response.error_message.c_str());
        return;
    }

    if (!response.ok())
    {
        ServerLogger::logWarning("Embedding API error (%ld): %s", response.status_code, response.body.c_str());
        return;
    }

    EmbeddingResponse parsed;
    try
    {
        parsed.from_json(nlohmann::json::parse(response.body));
    }
    catch (const std::exception& ex)
    {
        ServerLogger::logWarning("Undecodable embedding response: %s", ex.what());
        return;
    }

    std::sort(parsed.data.begin(), parsed.data.end(),
              [](const EmbeddingData& a, const EmbeddingData& b) { return a.index < b.index; });

    for (auto& item : parsed.data)
    {
        if (item.index < 0 || static_cast<size_t>(item.index) >= group.size())
        {
            ServerLogger::logDebug("Ignoring embedding with out-of-range index %d", item.index);
            continue;
        }
        out[offset + static_cast<size_t>(item.index)] = std::move(item.embedding);
    }
}

} // namespace retrieval
} // namespace chatraw
