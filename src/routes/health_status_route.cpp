#include "chatraw/routes/health_status_route.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/utils.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatraw
{
    namespace
    {
        json providerStatus(const ProviderConfig &provider)
        {
            return {{"configured", provider.isConfigured()}, {"model", provider.modelId}};
        }
    }

    HealthStatusRoute::HealthStatusRoute(const ServerConfig &config, const retrieval::DocumentService &documents)
        : config_(config), documents_(documents)
    {
    }

    bool HealthStatusRoute::match(const std::string &method, const std::string &path)
    {
        return method == "GET" && (path == "/health" || path == "/api/health");
    }

    void HealthStatusRoute::handle(SocketType sock, const std::string & /*body*/)
    {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

        json response = {
            {"status", "healthy"},
            {"timestamp", now},
            {"server", {{"name", "ChatRaw Server"}, {"version", "1.0.0"}}},
            {"providers",
             {{"chat", providerStatus(config_.chatProvider)},
              {"embedding", providerStatus(config_.embeddingProvider)},
              {"rerank", providerStatus(config_.rerankProvider)}}},
            {"documents", documents_.list().size()}};

        ServerLogger::logDebug("Health check served");
        send_response(sock, 200, response.dump());
    }

} // namespace chatraw
