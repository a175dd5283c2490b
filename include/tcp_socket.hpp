// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include "dns_resolver.hpp"

namespace cfscan
{
    // Owning wrapper around one stream socket. Not copyable.
    class TcpSocket
    {
        int sockfd_;

    public:
        TcpSocket();
        ~TcpSocket();
        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();

        // Non-blocking connect bounded by timeout; socket is left blocking on success.
        bool connectTo(const ResolvedAddress &ra, std::chrono::milliseconds timeout);
        // SO_RCVTIMEO / SO_SNDTIMEO so a stalled peer cannot hang recvAll().
        bool setIoTimeout(std::chrono::milliseconds timeout);

        bool sendAll(const std::string &data) const;
        std::string recvAll() const;
        int fd() const { return sockfd_; }
    };
} // namespace cfscan
