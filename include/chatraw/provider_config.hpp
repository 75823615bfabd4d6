#pragma once

#include <string>

namespace chatraw
{

/**
 * @brief Features a configured model advertises
 */
struct ProviderCapability
{
    bool vision = false;
    bool reasoning = false;
    bool tools = false;
};

/**
 * @brief Connection settings for one OpenAI-compatible provider (chat, embedding or rerank)
 */
struct ProviderConfig
{
    std::string apiUrl;                // Base URL, e.g. https://api.openai.com/v1
    std::string apiKey;                // Sent as "Authorization: Bearer <key>" when non-empty
    std::string modelId;               // Value of the "model" field in every request
    int contextLength = 8192;
    int maxOutput = 4096;              // Sent as max_tokens for chat requests
    ProviderCapability capability;

    bool isConfigured() const { return !apiUrl.empty() && !modelId.empty(); }

    // Joins the base URL (trailing slashes removed) with an endpoint path such as "/embeddings"
    std::string endpoint(const std::string& path) const
    {
        std::string base = apiUrl;
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        return base + path;
    }
};

} // namespace chatraw
