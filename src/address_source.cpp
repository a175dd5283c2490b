// ===================== src/address_source.cpp =====================
#include "address_source.hpp"
#include "diag_logger.hpp"
#include "http_client.hpp"
#include "terminal.hpp"
#include "utils_net.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace cfscan {

namespace {

std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// "a.b.c.d/n" (or a bare address = /32) -> network base and prefix.
bool parse_cidr(const std::string &cidr, uint32_t &base, int &prefix, std::string &why) {
    std::string addr = cidr;
    prefix = 32;
    auto slash = cidr.find('/');
    if (slash != std::string::npos) {
        addr = cidr.substr(0, slash);
        std::string p = cidr.substr(slash + 1);
        if (p.empty() || p.size() > 2 || p.find_first_not_of("0123456789") != std::string::npos) {
            why = "invalid prefix length";
            return false;
        }
        prefix = std::stoi(p);
        if (prefix > 32) {
            why = "prefix length out of range";
            return false;
        }
    }
    if (!net::parse_ipv4(addr, base)) {
        why = "not an IPv4 address";
        return false;
    }
    uint32_t mask = prefix == 0 ? 0 : ~uint32_t{0} << (32 - prefix);
    if ((base & ~mask) != 0) {
        why = "has host bits set";
        return false;
    }
    return true;
}

} // namespace

std::optional<std::vector<std::string>> parse_cloudflare_ips(const std::string &body) {
    if (!std::regex_search(body, std::regex("\"success\"\\s*:\\s*true")))
        return std::nullopt;

    std::smatch m;
    if (!std::regex_search(body, m, std::regex("\"ipv4_cidrs\"\\s*:\\s*\\[([^\\]]*)\\]")))
        return std::nullopt;

    std::vector<std::string> out;
    const std::string list = m[1].str();
    std::regex item("\"([^\"]*)\"");
    for (auto it = std::sregex_iterator(list.begin(), list.end(), item); it != std::sregex_iterator(); ++it)
        out.push_back((*it)[1].str());
    return out;
}

std::optional<std::vector<std::string>> fetch_cloudflare_cidrs(std::ostream &err, DiagLogger *diag,
                                                               std::chrono::milliseconds timeout) {
    try {
        HttpResponse resp = HttpClient::get(kCloudflareIpsUrl, timeout);
        if (resp.status != 200) {
            err << term::red() << "Error fetching Cloudflare IPs: HTTP status " << resp.status << term::reset() << "\n";
            return std::nullopt;
        }
        auto cidrs = parse_cloudflare_ips(resp.body);
        if (!cidrs) {
            err << term::red() << "Error: Could not fetch Cloudflare IP list. Response was not successful."
                << term::reset() << "\n";
            return std::nullopt;
        }
        if (diag) diag->log("CIDRS_FETCHED count=" + std::to_string(cidrs->size()));
        return cidrs;
    } catch (const std::exception &e) {
        err << term::red() << "Error fetching Cloudflare IPs: " << e.what() << term::reset() << "\n";
        if (diag) diag->log(std::string("CIDRS_FETCH_FAIL error=\"") + e.what() + "\"");
        return std::nullopt;
    }
}

std::vector<std::string> split_cidr_list(const std::string &content) {
    std::string flat = content;
    for (auto &c : flat)
        if (c == ',') c = '\n';

    std::vector<std::string> out;
    std::istringstream in(flat);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

std::vector<std::string> load_cidrs_from_file(const std::string &path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));
    std::ostringstream ss;
    ss << in.rdbuf();
    return split_cidr_list(ss.str());
}

std::vector<std::string> expand_cidrs(const std::vector<std::string> &cidrs, std::ostream &warn, DiagLogger *diag) {
    std::set<uint32_t> unique;
    for (const auto &cidr : cidrs) {
        uint32_t base = 0;
        int prefix = 0;
        std::string why;
        if (!parse_cidr(cidr, base, prefix, why)) {
            warn << term::yellow() << "Warning: Could not parse CIDR " << cidr << ": " << why << term::reset() << "\n";
            if (diag) diag->log("CIDR_SKIP cidr=" + cidr + " reason=\"" + why + "\"");
            continue;
        }

        // 64-bit so a /0 does not overflow
        const uint64_t first = base;
        const uint64_t last = first + (uint64_t{1} << (32 - prefix)) - 1;
        const uint64_t step = prefix >= 24 ? 1 : 16; // base of a /23 or larger is 16-aligned
        for (uint64_t a = first; a <= last; a += step)
            unique.insert(static_cast<uint32_t>(a));
    }

    std::vector<std::string> out;
    out.reserve(unique.size());
    for (uint32_t a : unique) out.push_back(net::ipv4_to_string(a));
    return out;
}

} // namespace cfscan
