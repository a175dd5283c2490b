// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"
#include <stdexcept>

namespace cfscan
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            host_start = scheme_end + 3;
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("unsupported URL scheme: " + scheme);
        port = (scheme == "https") ? 443 : 80;

        size_t path_start = url.find('/', host_start);
        if (path_start != std::string::npos)
        {
            host = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
        }
        else
        {
            host = url.substr(host_start);
        }

        size_t colon = host.rfind(':');
        if (colon != std::string::npos)
        {
            std::string port_str = host.substr(colon + 1);
            host.erase(colon);
            size_t used = 0;
            int p = 0;
            try
            {
                p = std::stoi(port_str, &used);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("bad port in URL: " + url);
            }
            if (used != port_str.size() || p <= 0 || p > 65535)
                throw std::invalid_argument("bad port in URL: " + url);
            port = p;
        }

        if (host.empty())
            throw std::invalid_argument("URL has no host: " + url);
    }

    std::string ParsedURL::toGetRequestString() const
    {
        return std::string("GET ") + path + " HTTP/1.1\r\n" +
               "Host: " + host + "\r\n" +
               "User-Agent: cfscan\r\n" +
               "Accept: application/json\r\n" +
               "Connection: close\r\n\r\n";
    }
} // namespace cfscan
