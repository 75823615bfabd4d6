#pragma once

#include "export.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace chatraw
{

/**
 * @brief Outbound POST request with a JSON body
 */
struct HttpRequest
{
    std::string url;
    std::string body;
    std::map<std::string, std::string> headers;
    long connectTimeoutMs = 10000;
    long timeoutMs = 60000;            // Total transfer time, 0 disables the limit
};

enum class TransportStatus
{
    Ok,                                // A response was received, whatever its HTTP status
    Timeout,
    TransportError,
    Cancelled                          // The data callback asked to stop
};

/**
 * @brief Outcome of an outbound call
 *
 * For streaming calls body holds the response only when the status is not 2xx.
 */
struct HttpResponse
{
    TransportStatus status = TransportStatus::TransportError;
    long status_code = 0;
    std::string body;
    std::string error_message;

    bool ok() const { return status == TransportStatus::Ok && status_code >= 200 && status_code < 300; }
};

/**
 * @brief Receives raw response bytes of a successful streaming call
 * @return false to abort the transfer
 */
using StreamDataCallback = std::function<bool(const char* data, size_t size)>;

/**
 * @brief Abstract HTTP transport shared by all provider clients
 */
class CHATRAW_SERVER_API IHttpTransport
{
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse post(const HttpRequest& request) = 0;

    virtual HttpResponse postStream(const HttpRequest& request, const StreamDataCallback& onData) = 0;
};

/**
 * @brief Build the standard headers for a provider request
 * @param apiKey Bearer token, omitted when empty
 */
CHATRAW_SERVER_API std::map<std::string, std::string> jsonHeaders(const std::string& apiKey);

/**
 * @brief libcurl-backed transport
 *
 * One instance is created at startup and handed by reference to every provider
 * client. Connections, DNS results and TLS sessions are pooled through a curl
 * share handle, so concurrent requests from different threads reuse them.
 */
class CHATRAW_SERVER_API CurlHttpClient : public IHttpTransport
{
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // Safe to call repeatedly; post() and postStream() call it on first use
    void init();

    // Releases the share handle and the global curl state; later calls fail with TransportError
    void shutdown();

    HttpResponse post(const HttpRequest& request) override;
    HttpResponse postStream(const HttpRequest& request, const StreamDataCallback& onData) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace chatraw
