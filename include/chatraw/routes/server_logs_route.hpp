#ifndef CHATRAW_SERVER_LOGS_ROUTE_HPP
#define CHATRAW_SERVER_LOGS_ROUTE_HPP

#include "route_interface.hpp"

namespace chatraw {

    /**
     * @brief GET /api/logs
     *
     * Returns the logger's recent history, oldest first.
     */
    class ServerLogsRoute : public IRoute {
    public:
        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const std::string& body) override;
    };

} // namespace chatraw

#endif // CHATRAW_SERVER_LOGS_ROUTE_HPP
