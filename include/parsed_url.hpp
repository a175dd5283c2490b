// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>

namespace cfscan
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "api.cloudflare.com"
        int port;           // explicit ":port", else 80/443 by scheme
        std::string path;   // e.g., "/client/v4/ips"

        // Throws std::invalid_argument on an empty host, unknown scheme or bad port.
        explicit ParsedURL(const std::string &url);
        std::string toGetRequestString() const;
    };
} // namespace cfscan
