#ifndef CHATRAW_ROUTE_INTERFACE_HPP
#define CHATRAW_ROUTE_INTERFACE_HPP

#include "../export.hpp"
#include "../utils.hpp"

#include <string>

namespace chatraw {

    class CHATRAW_SERVER_API IRoute {
    public:
        // Returns true if this route should handle the given method and path.
        virtual bool match(const std::string& method, const std::string& path) = 0;
        // Handle the request. The body contains the payload (if any).
        virtual void handle(SocketType sock, const std::string& body) = 0;
        virtual ~IRoute() = default;
    };

} // namespace chatraw

#endif // CHATRAW_ROUTE_INTERFACE_HPP
