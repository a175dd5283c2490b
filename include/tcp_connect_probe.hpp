// ===================== include/tcp_connect_probe.hpp =====================
#pragma once
#include "probe_strategy.hpp"

namespace cfscan {

// Times the TCP three-way handshake to a fixed service port.
class TcpConnectProbe : public ProbeStrategy {
public:
    explicit TcpConnectProbe(int port = 443, DiagLogger *diag = nullptr);

    const char *name() const override { return "tcp"; }
    int default_tries() const override { return 4; }
    std::size_t default_workers() const override { return 10; }

    int port() const { return port_; }

protected:
    std::optional<Latency> attempt(const std::string &address, int seq,
                                   std::chrono::milliseconds timeout) override;

private:
    int port_;
};

} // namespace cfscan
