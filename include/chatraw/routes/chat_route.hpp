#ifndef CHATRAW_CHAT_ROUTE_HPP
#define CHATRAW_CHAT_ROUTE_HPP

#include "route_interface.hpp"
#include "../chat/chat_service.hpp"

namespace chatraw {

    /**
     * @brief POST /api/chat
     *
     * Streams NDJSON events when streaming is enabled, otherwise answers
     * {chat_id, content, thinking, references}.
     */
    class ChatRoute : public IRoute {
    public:
        ChatRoute(ChatService& service, bool stream);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const std::string& body) override;

    private:
        void handleStreaming(SocketType sock, const ChatRequest& request);
        void handleNonStreaming(SocketType sock, const ChatRequest& request);

        ChatService& service_;
        bool stream_;
    };

} // namespace chatraw

#endif // CHATRAW_CHAT_ROUTE_HPP
