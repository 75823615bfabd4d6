#pragma once

#include <stdexcept>
#include <string>

namespace chatraw
{

/**
 * @brief Base class for failures of an outbound provider call
 *
 * statusCode follows HTTP conventions: the upstream status for HTTP errors,
 * 504 for timeouts, 502 for transport failures and 503 when no provider is configured.
 */
class ProviderError : public std::runtime_error
{
public:
    ProviderError(const std::string& message, int statusCode)
        : std::runtime_error(message), statusCode_(statusCode) {}

    int statusCode() const noexcept { return statusCode_; }

private:
    int statusCode_;
};

class ProviderUnconfiguredError : public ProviderError
{
public:
    explicit ProviderUnconfiguredError(const std::string& message)
        : ProviderError(message, 503) {}
};

// Upstream answered with a non-2xx status; the message is "API error (<status>): <body>"
class ProviderHttpError : public ProviderError
{
public:
    ProviderHttpError(long status, const std::string& body)
        : ProviderError("API error (" + std::to_string(status) + "): " + body, static_cast<int>(status)),
          body_(body) {}

    const std::string& body() const noexcept { return body_; }

private:
    std::string body_;
};

class ProviderTimeoutError : public ProviderError
{
public:
    ProviderTimeoutError() : ProviderError("Request timeout", 504) {}
};

class ProviderTransportError : public ProviderError
{
public:
    explicit ProviderTransportError(const std::string& message)
        : ProviderError(message, 502) {}
};

} // namespace chatraw
