#pragma once

#include "export.hpp"

#include <cstring>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <winsock2.h>
using SocketType = SOCKET;
#else
#include <sys/socket.h>
#include <unistd.h>
using SocketType = int;
#endif

#if defined(MSG_NOSIGNAL)
#define CHATRAW_SEND_FLAGS MSG_NOSIGNAL
#else
#define CHATRAW_SEND_FLAGS 0
#endif

struct StreamChunk
{
    std::string data;        // The content to stream
    bool isComplete = false; // Whether this is the final chunk

    StreamChunk() : data(""), isComplete(false) {}
    StreamChunk(const std::string& d, bool complete = false)
        : data(d), isComplete(complete) {
    }
};

// Get standard status text for HTTP status code
inline std::string get_status_text(int status_code) {
    switch (status_code) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default:  return "Error";
    }
}

// Sends all of data; false once the peer is gone
inline bool send_all(SocketType sock, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        auto n = send(sock, data.c_str() + sent, static_cast<int>(data.size() - sent), CHATRAW_SEND_FLAGS);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// OpenAI-style error body: {"error":{"message","type","param","code"}}
inline nlohmann::json make_error_body(const std::string& message, const std::string& type) {
    return {{"error", {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}}}};
}

// Regular response helper with support for custom headers
inline bool send_response(
    SocketType sock,
    int status_code,
    const std::string& body,
    const std::map<std::string, std::string>& headers = { {"Content-Type", "application/json"} }) {

    std::ostringstream response;
    response << "HTTP/1.1 " << status_code << " " << get_status_text(status_code) << "\r\n";
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n";
    response << "Access-Control-Allow-Origin: *\r\n";

    for (const auto& [name, value] : headers) {
        response << name << ": " << value << "\r\n";
    }

    response << "\r\n";
    response << body;

    return send_all(sock, response.str());
}

// Starts a chunked response; the body follows through send_stream_chunk
inline bool begin_streaming_response(
    SocketType sock,
    int status_code,
    const std::map<std::string, std::string>& headers = {}) {

    std::ostringstream headerStream;
    headerStream << "HTTP/1.1 " << status_code << " " << get_status_text(status_code) << "\r\n";
    headerStream << "Transfer-Encoding: chunked\r\n";
    headerStream << "Connection: close\r\n";
    headerStream << "Cache-Control: no-cache\r\n";
    headerStream << "X-Accel-Buffering: no\r\n";
    headerStream << "Access-Control-Allow-Origin: *\r\n";

    bool hasContentType = false;
    for (const auto& [name, value] : headers) {
        headerStream << name << ": " << value << "\r\n";
        if (name == "Content-Type" || name == "content-type") {
            hasContentType = true;
        }
    }

    if (!hasContentType) {
        headerStream << "Content-Type: application/x-ndjson\r\n";
    }

    headerStream << "\r\n";
    return send_all(sock, headerStream.str());
}

// Sends one chunk in HTTP chunked encoding; false once the peer is gone
inline bool send_stream_chunk(SocketType sock, const StreamChunk& chunk) {
    if (!chunk.data.empty()) {
        std::stringstream ss;
        ss << std::hex << chunk.data.size() << "\r\n" << chunk.data << "\r\n";
        if (!send_all(sock, ss.str())) {
            return false;
        }
    }

    if (chunk.isComplete) {
        return send_all(sock, "0\r\n\r\n");
    }
    return true;
}
