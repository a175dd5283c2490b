// ===================== src/http_client.cpp =====================
#include "http_client.hpp"
#include "dns_resolver.hpp"
#include "parsed_url.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace cfscan
{
    namespace
    {
        bool header_contains(const std::string &headers, const std::string &needle)
        {
            std::string lower(headers);
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lower.find(needle) != std::string::npos;
        }
    } // namespace

    HttpResponse HttpClient::get(const std::string &url, std::chrono::milliseconds timeout)
    {
        ParsedURL parsed(url);
        auto addrs = DNSResolver::resolve(parsed.host, parsed.port);

        for (const auto &ra : addrs)
        {
            TcpSocket tcp;
            if (!tcp.connectTo(ra, timeout) || !tcp.setIoTimeout(timeout))
                continue;

            const std::string req = parsed.toGetRequestString();
            std::string raw;
            if (parsed.scheme == "https")
            {
                SslSession tls;
                if (!tls.handshake(tcp.fd(), parsed.host))
                    throw std::runtime_error("TLS handshake with " + parsed.host + " failed: " + tls.lastError());
                if (!tls.sendAll(req))
                    throw std::runtime_error("TLS send to " + parsed.host + " failed");
                raw = tls.recvAll();
            }
            else
            {
                if (!tcp.sendAll(req))
                    throw std::runtime_error("TCP send to " + parsed.host + " failed");
                raw = tcp.recvAll();
            }
            return parse(raw);
        }
        throw std::runtime_error("Connect failed for all resolved addresses of " + parsed.host);
    }

    HttpResponse HttpClient::parse(const std::string &raw)
    {
        HttpResponse out;
        size_t header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
        {
            out.body = raw; // malformed (no headers)
            return out;
        }

        size_t line_end = raw.find("\r\n");
        std::string status_line = raw.substr(0, line_end);
        if (status_line.rfind("HTTP/", 0) == 0)
        {
            size_t sp = status_line.find(' ');
            if (sp != std::string::npos)
            {
                try
                {
                    out.status = std::stoi(status_line.substr(sp + 1, 3));
                }
                catch (const std::exception &)
                {
                    out.status = 0;
                }
            }
        }

        out.headers = (line_end < header_end) ? raw.substr(line_end + 2, header_end - line_end - 2) : std::string();
        out.body = raw.substr(header_end + 4);
        if (header_contains(out.headers, "transfer-encoding: chunked"))
            out.body = decodeChunked(out.body);
        return out;
    }

    std::string HttpClient::decodeChunked(const std::string &body)
    {
        std::string decoded;
        size_t pos = 0;
        while (pos < body.size())
        {
            size_t line_end = body.find("\r\n", pos);
            if (line_end == std::string::npos)
                break;
            std::string size_str = body.substr(pos, line_end - pos);
            size_t chunk_size = 0;
            try
            {
                chunk_size = std::stoul(size_str, nullptr, 16);
            }
            catch (const std::exception &)
            {
                break;
            }
            pos = line_end + 2;
            if (chunk_size == 0)
                break;
            if (pos + chunk_size > body.size())
            {
                decoded.append(body, pos, std::string::npos); // truncated final chunk
                break;
            }
            decoded.append(body, pos, chunk_size);
            pos += chunk_size + 2; // skip CRLF
        }
        return decoded;
    }
} // namespace cfscan
