#pragma once

#include "routes/route_interface.hpp"
#include "export.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#ifdef _WIN32
#include <winsock2.h>
using SocketType = SOCKET;
#else
#include <sys/socket.h>
#include <unistd.h>
using SocketType = int;
#endif

namespace chatraw
{

    class CHATRAW_SERVER_API Server
    {
    public:
        explicit Server(const std::string& port, const std::string& host = "0.0.0.0");
        ~Server();

        bool init();
        void addRoute(std::unique_ptr<IRoute> route);
        void run();
        void stop();

        // Blocks until every accepted connection has been handled and closed
        void waitForConnections();

        bool isRunning() const { return running; }
        const std::string& getPort() const { return port; }
        size_t activeConnections() const;

    private:
        void handleConnection(SocketType client_sock, const std::string& clientIP);

#pragma warning(push)
#pragma warning(disable: 4251)
        std::string port;
        std::string host;
#pragma warning(pop)
        SocketType listen_sock;
#pragma warning(push)
#pragma warning(disable: 4251)
        std::vector<std::unique_ptr<IRoute>> routes;
        std::atomic<bool> running;
        mutable std::mutex connections_mutex;
        std::condition_variable connections_done;
        size_t active_connections = 0;
#pragma warning(pop)
    };

} // namespace chatraw
