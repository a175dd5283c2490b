// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>

namespace cfscan
{
    struct ResolvedAddress
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;
    };

    class DNSResolver
    {
    public:
        // Throws std::runtime_error when getaddrinfo() fails.
        static std::vector<ResolvedAddress> resolve(const std::string &host, int port);

        // Dotted-quad literal -> stream endpoint, no lookup. nullopt if not IPv4.
        static std::optional<ResolvedAddress> numeric_ipv4(const std::string &address, int port);
    };
} // namespace cfscan
