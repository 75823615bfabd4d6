#ifndef CHATRAW_EMBEDDING_CLIENT_HPP
#define CHATRAW_EMBEDDING_CLIENT_HPP

#include "../export.hpp"
#include "../http_client.hpp"
#include "../provider_config.hpp"
#include <string>
#include <vector>

namespace chatraw
{
namespace retrieval
{

/**
 * @brief Client for an OpenAI-compatible embeddings endpoint
 *
 * Output always has one vector per input text, in input order. Items the
 * provider did not deliver (failed request, missing index) are empty vectors.
 */
class CHATRAW_SERVER_API EmbeddingClient
{
public:
    EmbeddingClient(IHttpTransport& transport, ProviderConfig provider,
                    long connectTimeoutMs = 10000, long timeoutMs = 60000);

    bool isConfigured() const { return provider_.isConfigured(); }

    /**
     * @brief Embed texts with one request per group of batch_size texts
     *
     * Groups are sent one after another. A group whose request fails yields
     * empty vectors for all of its texts; other groups are unaffected.
     */
    std::vector<std::vector<float>> embedBatch(const std::vector<std::string>& texts, int batch_size);

    std::vector<float> embedOne(const std::string& text);

private:
    // Fills out[offset, offset + group.size()) from one provider request
    void embedGroup(const std::vector<std::string>& group, size_t offset, std::vector<std::vector<float>>& out);

    IHttpTransport& transport_;
    ProviderConfig provider_;
    long connectTimeoutMs_;
    long timeoutMs_;
};

} // namespace retrieval
} // namespace chatraw

#endif // CHATRAW_EMBEDDING_CLIENT_HPP
