// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace cfscan
{
    TcpSocket::TcpSocket() : sockfd_(-1) {}
    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    bool TcpSocket::connectTo(const ResolvedAddress &ra, std::chrono::milliseconds timeout)
    {
        closeSocket();
        sockfd_ = ::socket(ra.family, ra.socktype, ra.protocol);
        if (sockfd_ == -1)
            return false;

        int flags = ::fcntl(sockfd_, F_GETFL, 0);
        if (flags == -1 || ::fcntl(sockfd_, F_SETFL, flags | O_NONBLOCK) == -1)
        {
            closeSocket();
            return false;
        }

        if (::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ra.addr), ra.addrlen) != 0)
        {
            if (errno != EINPROGRESS)
            {
                closeSocket();
                return false;
            }

            pollfd pfd{};
            pfd.fd = sockfd_;
            pfd.events = POLLOUT;
            int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (rc <= 0)
            {
                closeSocket(); // timed out (0) or poll error
                return false;
            }

            int err = 0;
            socklen_t len = sizeof(err);
            if (::getsockopt(sockfd_, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0)
            {
                closeSocket();
                return false;
            }
        }

        if (::fcntl(sockfd_, F_SETFL, flags) == -1)
        {
            closeSocket();
            return false;
        }
        return true;
    }

    bool TcpSocket::setIoTimeout(std::chrono::milliseconds timeout)
    {
        if (sockfd_ == -1)
            return false;
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        return ::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
               ::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    }

    bool TcpSocket::sendAll(const std::string &data) const
    {
        if (sockfd_ == -1)
            return false;
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
                return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string TcpSocket::recvAll() const
    {
        std::string response;
        if (sockfd_ == -1)
            return response;
        response.reserve(8192);
        char buf[4096];
        while (true)
        {
            ssize_t bytes = ::recv(sockfd_, buf, sizeof(buf), 0);
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace cfscan
