#include "tcp_connect_probe.hpp"
#include "dns_resolver.hpp"
#include "tcp_socket.hpp"

#include <sys/socket.h>

namespace cfscan {

TcpConnectProbe::TcpConnectProbe(int port, DiagLogger *diag)
    : ProbeStrategy(diag), port_(port) {}

// CONNECT: the kernel does the SYN/SYN-ACK dance, we just hold the stopwatch.
std::optional<Latency> TcpConnectProbe::attempt(const std::string &address, int /*seq*/,
                                                std::chrono::milliseconds timeout) {
    using clk = std::chrono::steady_clock;

    auto ra = DNSResolver::numeric_ipv4(address, port_);
    if (!ra) return std::nullopt;

    TcpSocket sock;
    auto t0 = clk::now();
    if (!sock.connectTo(*ra, timeout)) return std::nullopt;
    auto t1 = clk::now();

    (void)::shutdown(sock.fd(), SHUT_RDWR);
    return Latency(t1 - t0);
}

} // namespace cfscan
