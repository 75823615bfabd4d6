#include "chatraw/routes/verify_provider_route.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/utf8.hpp"
#include "chatraw/utils.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatraw
{
    namespace
    {
        const long kVerifyTimeoutMs = 30000;
        const size_t kErrorBodyLength = 200;

        json failure(const std::string &error)
        {
            return {{"success", false}, {"error", error}};
        }

        std::string lowercase(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        json verificationPayload(const std::string &type, const std::string &model)
        {
            if (type == "chat")
            {
                return {{"model", model},
                        {"messages", json::array({{{"role", "user"}, {"content", "Say OK"}}})},
                        {"max_tokens", 5},
                        {"stream", false}};
            }
            if (type == "embedding")
            {
                return {{"model", model}, {"input", "test"}};
            }
            return {{"model", model},
                    {"query", "test query"},
                    {"documents", json::array({"test document 1", "test document 2"})}};
        }

        std::string verificationPath(const std::string &type)
        {
            if (type == "chat")
                return "/chat/completions";
            if (type == "embedding")
                return "/embeddings";
            return "/rerank";
        }

        json rerankOutcome(const HttpResponse &response)
        {
            const std::string lowered = lowercase(response.body);
            if (response.body.find("Unexpected endpoint") != std::string::npos ||
                lowered.find("not found") != std::string::npos ||
                lowered.find("not supported") != std::string::npos)
            {
                return failure("Rerank not supported by this provider (no /rerank endpoint)");
            }
            if (!response.ok())
            {
                return failure("API error (" + std::to_string(response.status_code) + "): " +
                               utf8::prefix(response.body, kErrorBodyLength));
            }

            json body = json::parse(response.body, nullptr, false);
            if (body.is_discarded())
            {
                return failure("Invalid rerank response");
            }
            if (!body.is_object() || (!body.contains("results") && !body.contains("data")))
            {
                return failure("Invalid rerank response format");
            }
            return {{"success", true}};
        }
    }

    VerifyProviderRoute::VerifyProviderRoute(IHttpTransport &transport, const ServerConfig &config)
        : transport_(transport), config_(config)
    {
    }

    bool VerifyProviderRoute::match(const std::string &method, const std::string &path)
    {
        return method == "POST" && path == "/api/models/verify";
    }

    void VerifyProviderRoute::handle(SocketType sock, const std::string &body)
    {
        json j = json::parse(body.empty() ? "{}" : body, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            send_response(sock, 400, make_error_body("Invalid JSON in request body", "invalid_request_error").dump());
            return;
        }

        std::string type = "chat";
        if (j.contains("type"))
        {
            type = j["type"].is_string() ? j["type"].get<std::string>() : "";
        }

        ProviderConfig provider;
        if (type == "chat")
            provider = config_.chatProvider;
        else if (type == "embedding")
            provider = config_.embeddingProvider;
        else if (type == "rerank")
            provider = config_.rerankProvider;
        else
        {
            send_response(sock, 400, make_error_body("Field 'type' must be chat, embedding or rerank", "invalid_request_error").dump());
            return;
        }

        if (j.contains("api_url") && j["api_url"].is_string())
            provider.apiUrl = j["api_url"].get<std::string>();
        if (j.contains("api_key") && j["api_key"].is_string())
            provider.apiKey = j["api_key"].get<std::string>();
        if (j.contains("model_id") && j["model_id"].is_string())
            provider.modelId = j["model_id"].get<std::string>();

        if (!provider.isConfigured())
        {
            send_response(sock, 200, failure("API URL and Model ID required").dump());
            return;
        }

        HttpRequest request;
        request.url = provider.endpoint(verificationPath(type));
        request.body = verificationPayload(type, provider.modelId).dump();
        request.headers = jsonHeaders(provider.apiKey);
        request.connectTimeoutMs = config_.http.connectTimeoutMs;
        request.timeoutMs = kVerifyTimeoutMs;

        ServerLogger::logInfo("Verifying %s provider %s (model %s)", type.c_str(), request.url.c_str(), provider.modelId.c_str());
        HttpResponse response = transport_.post(request);

        json outcome;
        if (response.status == TransportStatus::Timeout)
        {
            outcome = failure("Request timeout");
        }
        else if (response.status != TransportStatus::Ok)
        {
            outcome = failure(response.error_message);
        }
        else if (type == "rerank")
        {
            outcome = rerankOutcome(response);
        }
        else if (response.ok())
        {
            outcome = {{"success", true}};
        }
        else
        {
            outcome = failure("API error (" + std::to_string(response.status_code) + "): " +
                              utf8::prefix(response.body, kErrorBodyLength));
        }

        if (!outcome["success"].get<bool>())
        {
            ServerLogger::logWarning("Verification of %s provider failed: %s", type.c_str(),
                                     outcome["error"].get<std::string>().c_str());
        }
        send_response(sock, 200, outcome.dump(-1, ' ', false, json::error_handler_t::replace));
    }

} // namespace chatraw
