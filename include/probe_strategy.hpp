// ===================== include/probe_strategy.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace cfscan {

class DiagLogger;

using Latency = std::chrono::duration<double, std::milli>;

// Running round-trip statistics over a series of attempts, the same numbers a
// `ping` summary line reports.
struct RttSummary {
    int transmitted{0};
    int received{0};
    double min_ms{0}, max_ms{0}, sum_ms{0};

    void add(const std::optional<Latency> &rtt);
    double avg_ms() const { return received ? sum_ms / received : 0.0; }

    // Mean RTT iff every transmitted attempt was answered.
    std::optional<Latency> mean_if_complete() const;
};

// One latency measurement against one address. Implementations supply a
// single attempt; the retry policy lives here so every variant shares it.
class ProbeStrategy {
public:
    virtual ~ProbeStrategy() = default;

    // Runs up to `tries` sequential attempts and stops at the first failure.
    // Returns the mean RTT only when all `tries` attempts succeeded. Never throws.
    std::optional<Latency> probe(const std::string &address, int tries,
                                 std::chrono::milliseconds per_attempt_timeout);

    virtual const char *name() const = 0;
    virtual int default_tries() const = 0;
    virtual std::size_t default_workers() const = 0;

protected:
    explicit ProbeStrategy(DiagLogger *diag) : diag_(diag) {}

    // nullopt = no reply, refused or timed out. May throw; probe() absorbs it.
    virtual std::optional<Latency> attempt(const std::string &address, int seq,
                                           std::chrono::milliseconds timeout) = 0;

    DiagLogger *diag_;

private:
    // attempt() with any exception turned into a failed attempt.
    std::optional<Latency> guarded_attempt(const std::string &address, int seq,
                                           std::chrono::milliseconds timeout);
};

} // namespace cfscan
