// ===================== src/icmp_echo_probe.cpp =====================
#include "icmp_echo_probe.hpp"
#include "diag_logger.hpp"
#include "icmp_socket.hpp"

#include <arpa/inet.h>
#include <unistd.h>

namespace cfscan {

IcmpEchoProbe::IcmpEchoProbe(DiagLogger *diag)
    : ProbeStrategy(diag), next_id_(static_cast<uint16_t>(::getpid())) {}

bool IcmpEchoProbe::available() {
    IcmpSocket s;
    return s.open();
}

std::optional<Latency> IcmpEchoProbe::attempt(const std::string &address, int seq,
                                              std::chrono::milliseconds timeout) {
    using clk = IcmpSocket::clk;

    in_addr dst{};
    if (inet_pton(AF_INET, address.c_str(), &dst) != 1) return std::nullopt;

    // One socket per attempt: workers never share receive queues.
    IcmpSocket sock;
    if (!sock.open()) {
        if (diag_) diag_->log("WARN icmp socket() failed addr=" + address);
        return std::nullopt;
    }

    const uint16_t id = next_id_.fetch_add(1);
    const uint16_t sq = static_cast<uint16_t>(seq + 1);
    auto t0 = clk::now();
    if (!sock.send_echo(dst, id, sq)) return std::nullopt;

    auto arrived = sock.wait_echo_reply(dst, id, sq, t0 + timeout);
    if (!arrived) return std::nullopt;
    return Latency(*arrived - t0);
}

} // namespace cfscan
