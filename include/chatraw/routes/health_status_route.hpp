#ifndef CHATRAW_HEALTH_STATUS_ROUTE_HPP
#define CHATRAW_HEALTH_STATUS_ROUTE_HPP

#include "route_interface.hpp"
#include "../retrieval/document_service.hpp"
#include "../server_config.hpp"

namespace chatraw {

    class HealthStatusRoute : public IRoute {
    public:
        HealthStatusRoute(const ServerConfig& config, const retrieval::DocumentService& documents);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const std::string& body) override;

    private:
        const ServerConfig& config_;
        const retrieval::DocumentService& documents_;
    };

} // namespace chatraw

#endif // CHATRAW_HEALTH_STATUS_ROUTE_HPP
