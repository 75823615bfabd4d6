#include "chatraw/routes/chat_route.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/provider_errors.hpp"
#include "chatraw/utils.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace chatraw
{

    ChatRoute::ChatRoute(ChatService &service, bool stream) : service_(service), stream_(stream)
    {
    }

    bool ChatRoute::match(const std::string &method, const std::string &path)
    {
        return method == "POST" && path == "/api/chat";
    }

    void ChatRoute::handle(SocketType sock, const std::string &body)
    {
        ChatRequest request;
        try
        {
            json j = json::parse(body.empty() ? "{}" : body);
            if (!j.is_object() || !j.contains("message") || !j["message"].is_string())
            {
                send_response(sock, 400, make_error_body("Message is required", "invalid_request_error").dump());
                return;
            }
            request.from_json(j);
        }
        catch (const json::parse_error &ex)
        {
            ServerLogger::logWarning("Invalid JSON in chat request: %s", ex.what());
            send_response(sock, 400, make_error_body("Invalid JSON in request body", "invalid_request_error").dump());
            return;
        }
        catch (const std::runtime_error &ex)
        {
            send_response(sock, 400, make_error_body(ex.what(), "invalid_request_error").dump());
            return;
        }

        if (!request.validate())
        {
            send_response(sock, 400, make_error_body("Message is required", "invalid_request_error").dump());
            return;
        }

        ServerLogger::logInfo("Chat request (chat %s, rag %s, thinking %s)",
                              request.chat_id.empty() ? "new" : request.chat_id.c_str(),
                              request.use_rag ? "on" : "off", request.enable_thinking ? "on" : "off");

        if (stream_)
        {
            handleStreaming(sock, request);
        }
        else
        {
            handleNonStreaming(sock, request);
        }
    }

    void ChatRoute::handleStreaming(SocketType sock, const ChatRequest &request)
    {
        if (!begin_streaming_response(sock, 200, {{"Content-Type", "application/x-ndjson"}}))
        {
            ServerLogger::logWarning("Client disconnected before the chat stream started");
            return;
        }

        auto sink = [sock](const StreamEvent &event) {
            return send_stream_chunk(sock, StreamChunk(eventToNdjson(event)));
        };

        const relay::RelayState state = service_.streamChat(request, sink);
        if (state != relay::RelayState::Cancelled)
        {
            send_stream_chunk(sock, StreamChunk("", true));
        }
    }

    void ChatRoute::handleNonStreaming(SocketType sock, const ChatRequest &request)
    {
        try
        {
            ChatResult result = service_.completeChat(request);
            send_response(sock, 200, result.to_json().dump(-1, ' ', false, json::error_handler_t::replace));
        }
        catch (const std::invalid_argument &ex)
        {
            send_response(sock, 404, make_error_body(ex.what(), "invalid_request_error").dump());
        }
        catch (const ProviderError &ex)
        {
            ServerLogger::logError("Chat completion failed (%d): %s", ex.statusCode(), ex.what());
            send_response(sock, 500, make_error_body(ex.what(), "server_error").dump(-1, ' ', false, json::error_handler_t::replace));
        }
    }

} // namespace chatraw
