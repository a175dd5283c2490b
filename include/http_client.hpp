// ===================== include/http_client.hpp =====================
#pragma once
#include <chrono>
#include <string>

namespace cfscan
{
    struct HttpResponse
    {
        int status{0};       // 0 = no parsable status line
        std::string headers; // raw header block, status line excluded
        std::string body;    // de-chunked
    };

    // One-shot HTTP/1.1 GET with "Connection: close", plain or over TLS.
    class HttpClient
    {
    public:
        // Throws std::runtime_error when no connection can be made, TLS fails
        // or the request cannot be sent. `timeout` bounds connect and each read.
        static HttpResponse get(const std::string &url, std::chrono::milliseconds timeout);

        static HttpResponse parse(const std::string &raw);
        static std::string decodeChunked(const std::string &body);
    };
} // namespace cfscan
