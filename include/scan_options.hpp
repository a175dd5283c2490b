// ===================== include/scan_options.hpp =====================
#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace cfscan {

enum class ProbeMode { Icmp, Tcp };

// Flat view of the command line. Unset optionals fall back to the chosen
// strategy's defaults when the engine is configured.
struct ScanOptions {
    std::string ip_list;              // empty = fetch from the API
    std::size_t limit{20};
    std::optional<double> max_latency_ms;
    std::string out_path;
    ProbeMode mode{ProbeMode::Tcp};
    std::optional<int> tries;
    int timeout_ms{1000};
    int port{443};
    std::optional<std::size_t> workers;
    std::size_t geo_workers{5};
    std::string log_path;
    bool no_color{false};
    bool help{false};
};

// Accepts "--flag=value" and "--flag value". Throws std::invalid_argument on
// unknown flags, malformed numbers and out-of-range values.
ScanOptions parse_options(int argc, char *argv[]);

ProbeMode parse_mode(const std::string &s);
const char *mode_name(ProbeMode m);

void print_usage(std::ostream &os, const char *argv0);

} // namespace cfscan
