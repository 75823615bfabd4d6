#ifndef CHATRAW_CHATS_ROUTE_HPP
#define CHATRAW_CHATS_ROUTE_HPP

#include "route_interface.hpp"
#include "../relay/chat_store.hpp"
#include <string>

namespace chatraw {

    /**
     * @brief POST and GET /api/chats, GET /api/chats/{id}/messages, DELETE /api/chats/{id}
     *
     * POST creates an empty chat titled "New Chat".
     */
    class ChatsRoute : public IRoute {
    public:
        explicit ChatsRoute(relay::IChatStore& chats);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const std::string& body) override;

    private:
        static thread_local std::string current_method_;
        static thread_local std::string current_path_;

        relay::IChatStore& chats_;
    };

} // namespace chatraw

#endif // CHATRAW_CHATS_ROUTE_HPP
