//// ===================== File: src/icmp_socket.cpp =====================
#include "icmp_socket.hpp"
#include "utils_net.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace cfscan
{
    namespace
    {
        constexpr size_t kPayloadBytes = 56; // same as ping(8)
    }

    bool IcmpSocket::open()
    {
        if (fd_ != -1)
            return true;
        fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
        raw_ = false;
        if (fd_ < 0)
        {
            fd_ = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
            raw_ = true;
        }
        return fd_ >= 0;
    }

    void IcmpSocket::close()
    {
        if (fd_ != -1)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool IcmpSocket::send_echo(const in_addr &dst, uint16_t id, uint16_t seq)
    {
        std::array<uint8_t, sizeof(icmphdr) + kPayloadBytes> pkt{};
        auto *icmp = reinterpret_cast<icmphdr *>(pkt.data());
        icmp->type = ICMP_ECHO;
        icmp->code = 0;
        icmp->un.echo.id = htons(id);
        icmp->un.echo.sequence = htons(seq);
        for (size_t i = 0; i < kPayloadBytes; ++i)
            pkt[sizeof(icmphdr) + i] = static_cast<uint8_t>(i);
        icmp->checksum = 0;
        icmp->checksum = net::csum16(pkt.data(), pkt.size());

        sockaddr_in to{};
        to.sin_family = AF_INET;
        to.sin_addr = dst;
        ssize_t n = ::sendto(fd_, pkt.data(), pkt.size(), 0, reinterpret_cast<sockaddr *>(&to), sizeof(to));
        return n == static_cast<ssize_t>(pkt.size());
    }

    std::optional<IcmpSocket::clk::time_point>
    IcmpSocket::wait_echo_reply(const in_addr &dst, uint16_t id, uint16_t seq, clk::time_point deadline)
    {
        std::array<uint8_t, 2048> buf{};
        while (true)
        {
            auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clk::now());
            if (remain.count() <= 0)
                return std::nullopt;

            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            int rc = ::poll(&pfd, 1, static_cast<int>(remain.count()));
            if (rc < 0 && errno == EINTR)
                continue;
            if (rc <= 0)
                return std::nullopt;

            sockaddr_in from{};
            socklen_t flen = sizeof(from);
            ssize_t n = ::recvfrom(fd_, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr *>(&from), &flen);
            auto arrived = clk::now();
            if (n <= 0)
                continue;
            if (from.sin_addr.s_addr != dst.s_addr)
                continue;
            if (is_echo_reply(buf.data(), static_cast<size_t>(n), raw_, id, seq))
                return arrived;
        }
    }

    bool IcmpSocket::is_echo_reply(const uint8_t *pkt, size_t len, bool raw, uint16_t id, uint16_t seq)
    {
        // Raw sockets hand us the IP header too; ping sockets do not.
        size_t off = 0;
        if (raw)
        {
            if (len < sizeof(iphdr))
                return false;
            iphdr ip{};
            std::memcpy(&ip, pkt, sizeof(ip));
            off = ip.ihl * 4u;
            if (off < sizeof(iphdr))
                return false;
        }
        if (off + sizeof(icmphdr) > len)
            return false;

        icmphdr icmp{};
        std::memcpy(&icmp, pkt + off, sizeof(icmp));
        if (icmp.type != ICMP_ECHOREPLY)
            return false;
        if (ntohs(icmp.un.echo.sequence) != seq)
            return false;
        // the kernel rewrites the id on ping sockets
        if (raw && ntohs(icmp.un.echo.id) != id)
            return false;
        return true;
    }
} // namespace cfscan
