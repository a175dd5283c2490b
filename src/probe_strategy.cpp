// ===================== src/probe_strategy.cpp =====================
#include "probe_strategy.hpp"
#include "diag_logger.hpp"

#include <algorithm>
#include <exception>

namespace cfscan {

void RttSummary::add(const std::optional<Latency> &rtt) {
    ++transmitted;
    if (!rtt) return;
    double ms = rtt->count();
    if (received == 0) {
        min_ms = max_ms = ms;
    } else {
        min_ms = std::min(min_ms, ms);
        max_ms = std::max(max_ms, ms);
    }
    sum_ms += ms;
    ++received;
}

std::optional<Latency> RttSummary::mean_if_complete() const {
    if (transmitted == 0 || received != transmitted) return std::nullopt;
    return Latency(avg_ms());
}

std::optional<Latency> ProbeStrategy::guarded_attempt(const std::string &address, int seq,
                                                      std::chrono::milliseconds timeout) {
    try {
        return attempt(address, seq, timeout);
    } catch (const std::exception &e) {
        if (diag_)
            diag_->log(std::string("PROBE_ERR mode=") + name() + " addr=" + address +
                       " seq=" + std::to_string(seq) + " error=\"" + e.what() + "\"");
        return std::nullopt;
    }
}

std::optional<Latency> ProbeStrategy::probe(const std::string &address, int tries,
                                            std::chrono::milliseconds per_attempt_timeout) {
    RttSummary summary;
    for (int i = 0; i < tries; ++i) {
        const std::optional<Latency> rtt = guarded_attempt(address, i, per_attempt_timeout);
        summary.add(rtt);
        if (!rtt) break; // one miss sinks the whole probe
    }

    auto result = summary.mean_if_complete();
    if (diag_) {
        if (result)
            diag_->log(std::string("PROBE_OK mode=") + name() + " addr=" + address +
                       " min/avg/max=" + std::to_string(summary.min_ms) + "/" +
                       std::to_string(summary.avg_ms()) + "/" + std::to_string(summary.max_ms));
        else
            diag_->log(std::string("PROBE_FAIL mode=") + name() + " addr=" + address +
                       " replies=" + std::to_string(summary.received) + "/" +
                       std::to_string(summary.transmitted));
    }
    return result;
}

} // namespace cfscan
