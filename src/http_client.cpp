#include "chatraw/http_client.hpp"
#include "chatraw/logger.hpp"
#include <curl/curl.h>
#include <array>
#include <mutex>
#include <shared_mutex>

namespace chatraw
{

std::map<std::string, std::string> jsonHeaders(const std::string& apiKey)
{
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    if (!apiKey.empty())
    {
        headers["Authorization"] = "Bearer " + apiKey;
    }
    return headers;
}

namespace
{

// Per-transfer state seen by the write callback
struct TransferContext
{
    CURL* curl = nullptr;
    const StreamDataCallback* onData = nullptr;
    std::string body;
    long statusCode = 0;
    bool statusKnown = false;
    bool aborted = false;
};

size_t WriteCallback(char* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize = size * nmemb;
    auto* context = static_cast<TransferContext*>(userp);

    if (!context->statusKnown)
    {
        curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &context->statusCode);
        context->statusKnown = true;
    }

    const bool success = context->statusCode >= 200 && context->statusCode < 300;
    if (context->onData && success)
    {
        if (!(*context->onData)(contents, totalSize))
        {
            context->aborted = true;
            return 0; // makes curl_easy_perform fail with CURLE_WRITE_ERROR
        }
        return totalSize;
    }

    context->body.append(contents, totalSize);
    return totalSize;
}

} // namespace

class CurlHttpClient::Impl
{
public:
    std::shared_mutex lifecycleMutex;
    bool initialized = false;
    bool shutDown = false;
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> shareLocks;

    static void lockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr)
    {
        static_cast<Impl*>(userptr)->shareLocks[data].lock();
    }

    static void unlockShare(CURL*, curl_lock_data data, void* userptr)
    {
        static_cast<Impl*>(userptr)->shareLocks[data].unlock();
    }

    void init()
    {
        std::unique_lock<std::shared_mutex> lock(lifecycleMutex);
        if (initialized || shutDown)
            return;

        curl_global_init(CURL_GLOBAL_DEFAULT);
        share = curl_share_init();
        if (share)
        {
            curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &Impl::lockShare);
            curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &Impl::unlockShare);
            curl_share_setopt(share, CURLSHOPT_USERDATA, this);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        }
        else
        {
            ServerLogger::logWarning("curl_share_init failed, outbound requests will not share connections");
        }

        initialized = true;
        ServerLogger::logDebug("HTTP client initialized");
    }

    void shutdown()
    {
        std::unique_lock<std::shared_mutex> lock(lifecycleMutex);
        if (!initialized || shutDown)
        {
            shutDown = true;
            return;
        }

        if (share)
        {
            curl_share_cleanup(share);
            share = nullptr;
        }
        curl_global_cleanup();
        shutDown = true;
        ServerLogger::logDebug("HTTP client shut down");
    }

    HttpResponse perform(const HttpRequest& request, const StreamDataCallback* onData)
    {
        HttpResponse response;

        std::shared_lock<std::shared_mutex> lock(lifecycleMutex);
        if (shutDown)
        {
            response.status = TransportStatus::TransportError;
            response.error_message = "HTTP client has been shut down";
            return response;
        }

        CURL* curl = curl_easy_init();
        if (!curl)
        {
            response.status = TransportStatus::TransportError;
            response.error_message = "Failed to initialize CURL";
            return response;
        }

        TransferContext context;
        context.curl = curl;
        context.onData = onData;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.connectTimeoutMs);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        if (share)
        {
            curl_easy_setopt(curl, CURLOPT_SHARE, share);
        }

        struct curl_slist* headers = nullptr;
        for (const auto& [key, value] : request.headers)
        {
            std::string header = key + ": " + value;
            headers = curl_slist_append(headers, header.c_str());
        }
        if (headers)
        {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        }

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

        if (headers)
        {
            curl_slist_free_all(headers);
        }
        curl_easy_cleanup(curl);

        response.body = std::move(context.body);

        if (context.aborted)
        {
            response.status = TransportStatus::Cancelled;
            response.error_message = "Transfer aborted by receiver";
        }
        else if (res == CURLE_OPERATION_TIMEDOUT)
        {
            response.status = TransportStatus::Timeout;
            response.error_message = "Request timeout";
        }
        else if (res != CURLE_OK)
        {
            response.status = TransportStatus::TransportError;
            response.error_message = "CURL error: " + std::string(curl_easy_strerror(res));
        }
        else
        {
            response.status = TransportStatus::Ok;
        }

        if (response.status != TransportStatus::Ok)
        {
            ServerLogger::logDebug("POST %s failed: %s", request.url.c_str(), response.error_message.c_str());
        }

        return response;
    }
};

CurlHttpClient::CurlHttpClient() : pImpl(std::make_unique<Impl>())
{
}

CurlHttpClient::~CurlHttpClient()
{
    pImpl->shutdown();
}

void CurlHttpClient::init()
{
    pImpl->init();
}

void CurlHttpClient::shutdown()
{
    pImpl->shutdown();
}

HttpResponse CurlHttpClient::post(const HttpRequest& request)
{
    pImpl->init();
    return pImpl->perform(request, nullptr);
}

HttpResponse CurlHttpClient::postStream(const HttpRequest& request, const StreamDataCallback& onData)
{
    pImpl->init();
    return pImpl->perform(request, &onData);
}

} // namespace chatraw
