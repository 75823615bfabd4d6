#include "chatraw/routes/chats_route.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatraw
{
    thread_local std::string ChatsRoute::current_method_;
    thread_local std::string ChatsRoute::current_path_;

    namespace
    {
        const std::string kChatsPrefix = "/api/chats";
        const std::string kMessagesSuffix = "/messages";

        // Extracts {id} from /api/chats/{id}[suffix]; empty when the path has another shape
        std::string chatIdFromPath(const std::string &path, const std::string &suffix)
        {
            const std::string prefix = kChatsPrefix + "/";
            if (path.compare(0, prefix.size(), prefix) != 0 || path.size() <= prefix.size() + suffix.size())
            {
                return "";
            }
            if (!suffix.empty() && path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0)
            {
                return "";
            }
            std::string id = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
            return id.find('/') == std::string::npos ? id : "";
        }
    }

    ChatsRoute::ChatsRoute(relay::IChatStore &chats) : chats_(chats)
    {
    }

    bool ChatsRoute::match(const std::string &method, const std::string &path)
    {
        bool matches = false;
        if (method == "POST")
        {
            matches = path == kChatsPrefix;
        }
        else if (method == "GET")
        {
            matches = path == kChatsPrefix || !chatIdFromPath(path, kMessagesSuffix).empty();
        }
        else if (method == "DELETE")
        {
            matches = !chatIdFromPath(path, "").empty();
        }

        if (matches)
        {
            current_method_ = method;
            current_path_ = path;
        }
        return matches;
    }

    void ChatsRoute::handle(SocketType sock, const std::string & /*body*/)
    {
        if (current_method_ == "POST")
        {
            const relay::ChatRecord chat = chats_.createChat("New Chat");
            ServerLogger::logInfo("Created chat %s", chat.id.c_str());
            send_response(sock, 200, chat.to_json().dump());
            return;
        }

        if (current_method_ == "GET" && current_path_ == kChatsPrefix)
        {
            json chats = json::array();
            for (const auto &chat : chats_.listChats())
            {
                chats.push_back(chat.to_json());
            }
            send_response(sock, 200, chats.dump(-1, ' ', false, json::error_handler_t::replace));
            return;
        }

        if (current_method_ == "GET")
        {
            const std::string chatId = chatIdFromPath(current_path_, kMessagesSuffix);
            if (!chats_.hasChat(chatId))
            {
                send_response(sock, 404, make_error_body("Chat not found: " + chatId, "invalid_request_error").dump());
                return;
            }
            json messages = json::array();
            for (const auto &message : chats_.getMessages(chatId))
            {
                messages.push_back(message.to_json());
            }
            send_response(sock, 200, messages.dump(-1, ' ', false, json::error_handler_t::replace));
            return;
        }

        const std::string chatId = chatIdFromPath(current_path_, "");
        if (!chats_.deleteChat(chatId))
        {
            send_response(sock, 404, make_error_body("Chat not found: " + chatId, "invalid_request_error").dump());
            return;
        }
        ServerLogger::logInfo("Deleted chat %s", chatId.c_str());
        send_response(sock, 200, json{{"success", true}}.dump());
    }

} // namespace chatraw
