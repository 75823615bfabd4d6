#include "chatraw/routes/server_logs_route.hpp"
#include "chatraw/logger.hpp"
#include "chatraw/store_utils.hpp"
#include "chatraw/utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace chatraw
{
    namespace
    {
        const char *levelName(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::SERVER_ERROR:
                return "ERROR";
            case LogLevel::SERVER_WARNING:
                return "WARNING";
            case LogLevel::SERVER_INFO:
                return "INFO";
            case LogLevel::SERVER_DEBUG:
                return "DEBUG";
            }
            return "UNKNOWN";
        }
    }

    bool ServerLogsRoute::match(const std::string &method, const std::string &path)
    {
        return method == "GET" && path == "/api/logs";
    }

    void ServerLogsRoute::handle(SocketType sock, const std::string & /*body*/)
    {
        const auto logs = ServerLogger::instance().getLogs();

        json entries = json::array();
        for (const auto &entry : logs)
        {
            entries.push_back({{"level", levelName(entry.level)},
                               {"timestamp", entry.timestamp},
                               {"message", entry.message}});
        }

        json response = {
            {"logs", entries},
            {"total_count", entries.size()},
            {"retrieved_at", currentIsoTimestamp()}};

        send_response(sock, 200, response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

} // namespace chatraw
