#include "icmp_echo_probe.hpp"
#include "icmp_socket.hpp"
#include "probe_strategy.hpp"
#include "tcp_connect_probe.hpp"
#include "test_harness.hpp"

#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

using namespace cfscan;

namespace {

// Replays a fixed script of attempt results; -1 = no reply, -2 = throws.
class ScriptedProbe : public ProbeStrategy {
public:
    explicit ScriptedProbe(std::vector<double> script) : ProbeStrategy(nullptr), script_(std::move(script)) {}

    const char* name() const override { return "scripted"; }
    int default_tries() const override { return 3; }
    std::size_t default_workers() const override { return 1; }

    int calls{0};

protected:
    std::optional<Latency> attempt(const std::string&, int seq, std::chrono::milliseconds) override {
        ++calls;
        double v = script_.at(static_cast<size_t>(seq));
        if (v == -2) throw std::runtime_error("socket exploded");
        if (v < 0) return std::nullopt;
        return Latency(v);
    }

private:
    std::vector<double> script_;
};

// Loopback listener on an ephemeral port; the kernel completes handshakes
// from the backlog without accept().
struct Listener {
    int fd{-1};
    int port{0};
    Listener() {
        fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        a.sin_port = 0;
        if (fd < 0 || ::bind(fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) != 0 || ::listen(fd, 16) != 0)
            throw std::runtime_error("cannot listen on loopback");
        socklen_t len = sizeof(a);
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&a), &len);
        port = ntohs(a.sin_port);
    }
    ~Listener() { if (fd >= 0) ::close(fd); }
};

const std::chrono::milliseconds kTimeout(500);

// Echo packet as a socket would return it: bare ICMP for ping sockets,
// IP header + ICMP for raw ones.
std::vector<uint8_t> echo_packet(uint8_t type, uint16_t id, uint16_t seq, bool with_ip, uint8_t ihl = 5) {
    std::vector<uint8_t> pkt;
    if (with_ip) {
        iphdr ip{};
        ip.version = 4;
        ip.ihl = ihl;
        ip.protocol = IPPROTO_ICMP;
        pkt.resize(sizeof(ip));
        std::memcpy(pkt.data(), &ip, sizeof(ip));
    }
    icmphdr icmp{};
    icmp.type = type;
    icmp.un.echo.id = htons(id);
    icmp.un.echo.sequence = htons(seq);
    size_t off = pkt.size();
    pkt.resize(off + sizeof(icmp) + 8, 0xab);
    std::memcpy(pkt.data() + off, &icmp, sizeof(icmp));
    return pkt;
}

} // namespace

bool test_all_attempts_succeed_gives_mean() {
    ScriptedProbe p({10, 20, 30});
    auto r = p.probe("198.51.100.1", 3, kTimeout);
    CHECK(r.has_value());
    CHECK(r->count() == 20.0);
    CHECK(p.calls == 3);
    return true;
}

bool test_any_failure_fails_probe() {
    ScriptedProbe p({10, -1, 30, 40});
    auto r = p.probe("198.51.100.1", 4, kTimeout);
    CHECK(!r.has_value());
    CHECK(p.calls == 2); // stops at the first miss
    return true;
}

bool test_last_attempt_failure_fails_probe() {
    ScriptedProbe p({10, 20, -1});
    CHECK(!p.probe("198.51.100.1", 3, kTimeout).has_value());
    return true;
}

bool test_throwing_attempt_is_a_failure() {
    ScriptedProbe p({10, -2, 10});
    CHECK(!p.probe("198.51.100.1", 3, kTimeout).has_value());
    CHECK(p.calls == 2);

    // A throw after successful attempts must not reuse the earlier RTT.
    ScriptedProbe q({10, 10, -2});
    CHECK(!q.probe("198.51.100.1", 3, kTimeout).has_value());
    CHECK(q.calls == 3);
    return true;
}

bool test_zero_tries_is_unreachable() {
    ScriptedProbe p({10});
    CHECK(!p.probe("198.51.100.1", 0, kTimeout).has_value());
    CHECK(p.calls == 0);
    return true;
}

bool test_rtt_summary() {
    RttSummary s;
    s.add(Latency(4));
    s.add(Latency(2));
    s.add(Latency(6));
    CHECK(s.transmitted == 3 && s.received == 3);
    CHECK(s.min_ms == 2 && s.max_ms == 6 && s.avg_ms() == 4);
    CHECK(s.mean_if_complete()->count() == 4);

    s.add(std::nullopt);
    CHECK(s.received == 3 && s.transmitted == 4);
    CHECK(!s.mean_if_complete());
    CHECK(!RttSummary{}.mean_if_complete());
    return true;
}

bool test_tcp_connect_to_listener() {
    Listener l;
    TcpConnectProbe p(l.port);
    auto r = p.probe("127.0.0.1", 3, kTimeout);
    CHECK(r.has_value());
    CHECK(r->count() >= 0.0);
    CHECK(r->count() < kTimeout.count());
    return true;
}

bool test_tcp_connect_refused() {
    int port = 0;
    {
        Listener l;
        port = l.port;
    } // closed: nothing listens there any more
    TcpConnectProbe p(port);
    CHECK(!p.probe("127.0.0.1", 2, kTimeout).has_value());
    return true;
}

bool test_tcp_connect_bad_address() {
    TcpConnectProbe p(443);
    CHECK(!p.probe("not-an-address", 2, kTimeout).has_value());
    return true;
}

bool test_echo_reply_matching_ping_socket() {
    auto ok = echo_packet(ICMP_ECHOREPLY, 77, 3, false);
    CHECK(IcmpSocket::is_echo_reply(ok.data(), ok.size(), false, 77, 3));
    CHECK(IcmpSocket::is_echo_reply(ok.data(), ok.size(), false, 1234, 3)); // id belongs to the kernel
    CHECK(!IcmpSocket::is_echo_reply(ok.data(), ok.size(), false, 77, 4));

    auto request = echo_packet(ICMP_ECHO, 77, 3, false);
    CHECK(!IcmpSocket::is_echo_reply(request.data(), request.size(), false, 77, 3));

    CHECK(!IcmpSocket::is_echo_reply(ok.data(), sizeof(icmphdr) - 1, false, 77, 3));
    return true;
}

bool test_echo_reply_matching_raw_socket() {
    auto ok = echo_packet(ICMP_ECHOREPLY, 77, 3, true);
    CHECK(IcmpSocket::is_echo_reply(ok.data(), ok.size(), true, 77, 3));
    CHECK(!IcmpSocket::is_echo_reply(ok.data(), ok.size(), true, 78, 3));
    CHECK(!IcmpSocket::is_echo_reply(ok.data(), ok.size(), true, 77, 2));

    // read as a ping-socket packet, the IP header is not skipped
    CHECK(!IcmpSocket::is_echo_reply(ok.data(), ok.size(), false, 77, 3));

    auto long_header = echo_packet(ICMP_ECHOREPLY, 77, 3, true, 15);
    CHECK(!IcmpSocket::is_echo_reply(long_header.data(), long_header.size(), true, 77, 3));
    auto bad_header = echo_packet(ICMP_ECHOREPLY, 77, 3, true, 2);
    CHECK(!IcmpSocket::is_echo_reply(bad_header.data(), bad_header.size(), true, 77, 3));

    CHECK(!IcmpSocket::is_echo_reply(ok.data(), sizeof(iphdr) - 1, true, 77, 3));
    return true;
}

bool test_echo_wait_honours_deadline() {
    using clk = IcmpSocket::clk;
    IcmpSocket s; // never opened: poll() sees no events until the deadline
    in_addr dst{};
    dst.s_addr = htonl(INADDR_LOOPBACK);

    auto t0 = clk::now();
    CHECK(!s.wait_echo_reply(dst, 1, 1, t0 + std::chrono::milliseconds(60)).has_value());
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(clk::now() - t0);
    CHECK(waited.count() >= 40);
    CHECK(waited.count() < 1000);

    t0 = clk::now();
    CHECK(!s.wait_echo_reply(dst, 1, 1, t0 - std::chrono::milliseconds(1)).has_value());
    CHECK(clk::now() - t0 < std::chrono::milliseconds(40));
    return true;
}

bool test_icmp_defaults_and_bad_address() {
    IcmpEchoProbe p;
    CHECK(std::string(p.name()) == "icmp");
    CHECK(p.default_tries() == 6);
    CHECK(p.default_workers() == 50);
    CHECK(!p.probe("not-an-address", 2, kTimeout).has_value());
    return true;
}

bool test_icmp_echo_loopback() {
    if (!IcmpEchoProbe::available()) {
        std::cout << "(no ICMP socket permitted, skipped) ";
        return true;
    }
    IcmpEchoProbe p;
    auto r = p.probe("127.0.0.1", 3, kTimeout);
    CHECK(r.has_value());
    CHECK(r->count() >= 0.0);
    CHECK(r->count() < kTimeout.count());
    return true;
}

int main() {
    std::cout << "Running probe strategy tests...\n";

    run_test("All Attempts Succeed Gives Mean", test_all_attempts_succeed_gives_mean);
    run_test("Any Failure Fails Probe", test_any_failure_fails_probe);
    run_test("Last Attempt Failure", test_last_attempt_failure_fails_probe);
    run_test("Throwing Attempt", test_throwing_attempt_is_a_failure);
    run_test("Zero Tries", test_zero_tries_is_unreachable);
    run_test("RTT Summary", test_rtt_summary);
    run_test("TCP Connect To Listener", test_tcp_connect_to_listener);
    run_test("TCP Connect Refused", test_tcp_connect_refused);
    run_test("TCP Connect Bad Address", test_tcp_connect_bad_address);
    run_test("Echo Reply Matching (ping socket)", test_echo_reply_matching_ping_socket);
    run_test("Echo Reply Matching (raw socket)", test_echo_reply_matching_raw_socket);
    run_test("Echo Wait Honours Deadline", test_echo_wait_honours_deadline);
    run_test("ICMP Defaults And Bad Address", test_icmp_defaults_and_bad_address);
    run_test("ICMP Echo Loopback", test_icmp_echo_loopback);

    return finish_tests("Probe strategy tests");
}
