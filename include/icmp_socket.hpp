//// ===================== File: include/icmp_socket.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <netinet/in.h>

namespace cfscan
{
    // Echo request/reply endpoint. Prefers the unprivileged ping socket
    // (SOCK_DGRAM, needs net.ipv4.ping_group_range) and falls back to
    // SOCK_RAW (needs CAP_NET_RAW/root).
    class IcmpSocket
    {
    public:
        using clk = std::chrono::steady_clock;

        IcmpSocket() = default;
        ~IcmpSocket() { close(); }
        IcmpSocket(const IcmpSocket &) = delete;
        IcmpSocket &operator=(const IcmpSocket &) = delete;

        bool open();
        void close();
        int fd() const { return fd_; }

        bool send_echo(const in_addr &dst, uint16_t id, uint16_t seq);

        // Waits until `deadline` for the echo reply from `dst` matching seq
        // (and id on raw sockets; the kernel owns the id on ping sockets).
        // Returns the arrival time, nullopt on timeout.
        std::optional<clk::time_point> wait_echo_reply(const in_addr &dst, uint16_t id, uint16_t seq,
                                                       clk::time_point deadline);

        // True if `pkt` (as read from a socket of the given kind) is the echo
        // reply for id/seq. Raw packets start with the IP header.
        static bool is_echo_reply(const uint8_t *pkt, size_t len, bool raw, uint16_t id, uint16_t seq);

    private:
        int fd_ = -1;
        bool raw_ = false;
    };
} // namespace cfscan
