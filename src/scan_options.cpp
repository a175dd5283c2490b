// ===================== src/scan_options.cpp =====================
#include "scan_options.hpp"

#include <stdexcept>

namespace cfscan {

namespace {

long long to_integer(const std::string &flag, const std::string &v, long long lo, long long hi) {
    size_t used = 0;
    long long n = 0;
    try {
        n = std::stoll(v, &used);
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + " expects an integer, got '" + v + "'");
    }
    if (used != v.size()) throw std::invalid_argument(flag + " expects an integer, got '" + v + "'");
    if (n < lo || n > hi)
        throw std::invalid_argument(flag + " must be between " + std::to_string(lo) + " and " + std::to_string(hi));
    return n;
}

double to_positive_double(const std::string &flag, const std::string &v) {
    size_t used = 0;
    double d = 0;
    try {
        d = std::stod(v, &used);
    } catch (const std::exception &) {
        throw std::invalid_argument(flag + " expects a number, got '" + v + "'");
    }
    if (used != v.size() || !(d > 0)) throw std::invalid_argument(flag + " must be a positive number");
    return d;
}

} // namespace

ProbeMode parse_mode(const std::string &s) {
    if (s == "icmp") return ProbeMode::Icmp;
    if (s == "tcp")  return ProbeMode::Tcp;
    throw std::invalid_argument("bad mode: " + s);
}

const char *mode_name(ProbeMode m) { return m == ProbeMode::Icmp ? "icmp" : "tcp"; }

ScanOptions parse_options(int argc, char *argv[]) {
    ScanOptions opt;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") { opt.help = true; continue; }
        if (a == "--no-color") { opt.no_color = true; continue; }
        if (a.rfind("--", 0) != 0) throw std::invalid_argument("unexpected argument: " + a);

        std::string flag = a, value;
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            flag = a.substr(0, eq);
            value = a.substr(eq + 1);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw std::invalid_argument(flag + " needs a value");
        }

        if (flag == "--ip-list")          opt.ip_list = value;
        else if (flag == "--limit")       opt.limit = static_cast<std::size_t>(to_integer(flag, value, 1, 100000));
        else if (flag == "--max-latency") opt.max_latency_ms = to_positive_double(flag, value);
        else if (flag == "--out")         opt.out_path = value;
        else if (flag == "--mode")        opt.mode = parse_mode(value);
        else if (flag == "--tries")       opt.tries = static_cast<int>(to_integer(flag, value, 1, 100));
        else if (flag == "--timeout")     opt.timeout_ms = static_cast<int>(to_integer(flag, value, 1, 60000));
        else if (flag == "--port")        opt.port = static_cast<int>(to_integer(flag, value, 1, 65535));
        else if (flag == "--workers")     opt.workers = static_cast<std::size_t>(to_integer(flag, value, 1, 1024));
        else if (flag == "--geo-workers") opt.geo_workers = static_cast<std::size_t>(to_integer(flag, value, 1, 64));
        else if (flag == "--log")         opt.log_path = value;
        else throw std::invalid_argument("unknown option: " + flag);

        if (value.empty() && (flag == "--ip-list" || flag == "--out" || flag == "--log"))
            throw std::invalid_argument(flag + " needs a non-empty path");
    }
    return opt;
}

void print_usage(std::ostream &os, const char *argv0) {
    os << "Usage:\n"
       << "  " << argv0 << " [--ip-list=PATH] [--limit=N] [--max-latency=MS] [--out=PATH]\n"
       << "         [--mode=tcp|icmp] [--tries=N] [--timeout=MS] [--port=N]\n"
       << "         [--workers=N] [--geo-workers=N] [--log=PATH] [--no-color]\n"
       << "\nOptions:\n"
       << "  --ip-list=PATH     load ranges from a comma or newline separated file\n"
       << "                     instead of fetching them from the Cloudflare API\n"
       << "  --limit=N          keep the N lowest-latency addresses (default 20)\n"
       << "  --max-latency=MS   only rank addresses faster than MS milliseconds\n"
       << "  --out=PATH         save the final table to PATH\n"
       << "  --mode=tcp|icmp    TCP handshake timing (default) or ICMP echo\n"
       << "  --tries=N          attempts per address, all must succeed (tcp 4, icmp 6)\n"
       << "  --timeout=MS       per-attempt timeout (default 1000)\n"
       << "  --port=N           service port for tcp mode (default 443)\n"
       << "  --workers=N        concurrent probes (tcp 10, icmp 50)\n"
       << "  --geo-workers=N    concurrent location lookups (default 5)\n"
       << "  --log=PATH         append diagnostics to PATH\n"
       << "\nNotes:\n"
       << "  - icmp mode needs an ICMP socket: sudo/CAP_NET_RAW, or ping_group_range.\n";
}

} // namespace cfscan
