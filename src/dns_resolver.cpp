// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <stdexcept>

namespace cfscan
{
    std::vector<ResolvedAddress> DNSResolver::resolve(const std::string &host, int port)
    {
        std::vector<ResolvedAddress> results;

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo *res = nullptr;

        const std::string portStr = std::to_string(port);
        int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
        if (status != 0)
        {
            throw std::runtime_error(std::string("DNS resolution failed for ") + host + ": " + gai_strerror(status));
        }

        for (auto *p = res; p != nullptr; p = p->ai_next)
        {
            ResolvedAddress ra{};
            ra.family = p->ai_family;
            ra.socktype = p->ai_socktype;
            ra.protocol = p->ai_protocol;
            ra.addrlen = static_cast<socklen_t>(p->ai_addrlen);
            std::memcpy(&ra.addr, p->ai_addr, p->ai_addrlen);
            results.push_back(ra);
        }
        freeaddrinfo(res);
        if (results.empty())
            throw std::runtime_error("No usable address for " + host);
        return results;
    }

    std::optional<ResolvedAddress> DNSResolver::numeric_ipv4(const std::string &address, int port)
    {
        sockaddr_in sin{};
        sin.sin_family = AF_INET;
        sin.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, address.c_str(), &sin.sin_addr) != 1)
            return std::nullopt;

        ResolvedAddress ra{};
        ra.family = AF_INET;
        ra.socktype = SOCK_STREAM;
        ra.protocol = IPPROTO_TCP;
        ra.addrlen = sizeof(sin);
        std::memcpy(&ra.addr, &sin, sizeof(sin));
        return ra;
    }
} // namespace cfscan
