// ===================== include/icmp_echo_probe.hpp =====================
#pragma once
#include <atomic>
#include <cstdint>
#include "probe_strategy.hpp"

namespace cfscan {

// ICMP echo request/reply timing, one echo per attempt.
class IcmpEchoProbe : public ProbeStrategy {
public:
    explicit IcmpEchoProbe(DiagLogger *diag = nullptr);

    const char *name() const override { return "icmp"; }
    int default_tries() const override { return 6; }
    std::size_t default_workers() const override { return 50; }

    // Whether this process may open any ICMP socket at all.
    static bool available();

protected:
    std::optional<Latency> attempt(const std::string &address, int seq,
                                   std::chrono::milliseconds timeout) override;

private:
    std::atomic<uint16_t> next_id_;
};

} // namespace cfscan
