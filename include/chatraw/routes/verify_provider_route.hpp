#ifndef CHATRAW_VERIFY_PROVIDER_ROUTE_HPP
#define CHATRAW_VERIFY_PROVIDER_ROUTE_HPP

#include "route_interface.hpp"
#include "../http_client.hpp"
#include "../server_config.hpp"
#include <string>

namespace chatraw {

    /**
     * @brief POST /api/models/verify
     *
     * Body: {"type":"chat"|"embedding"|"rerank", "api_url"?, "api_key"?, "model_id"?}.
     * Fields present in the body override the configured provider of that type, so
     * settings can be checked before they are saved. Sends one minimal request to
     * the provider and answers {"success":true} or {"success":false,"error":...}.
     */
    class VerifyProviderRoute : public IRoute {
    public:
        VerifyProviderRoute(IHttpTransport& transport, const ServerConfig& config);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const std::string& body) override;

    private:
        IHttpTransport& transport_;
        const ServerConfig& config_;
    };

} // namespace chatraw

#endif // CHATRAW_VERIFY_PROVIDER_ROUTE_HPP
