#include "scan_options.hpp"
#include "test_harness.hpp"

#include <stdexcept>
#include <vector>

using namespace cfscan;

namespace {

ScanOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "cfscan");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return parse_options(static_cast<int>(argv.size()), argv.data());
}

bool rejects(std::vector<std::string> args) {
    try {
        parse(std::move(args));
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

bool test_defaults() {
    ScanOptions o = parse({});
    CHECK(o.ip_list.empty());
    CHECK(o.limit == 20);
    CHECK(!o.max_latency_ms);
    CHECK(o.mode == ProbeMode::Tcp);
    CHECK(!o.tries && !o.workers);
    CHECK(o.timeout_ms == 1000);
    CHECK(o.port == 443);
    CHECK(o.geo_workers == 5);
    CHECK(!o.no_color && !o.help);
    return true;
}

bool test_equals_and_separate_values() {
    ScanOptions o = parse({"--limit=5", "--max-latency", "150", "--ip-list=ranges.txt", "--out", "best.txt",
                           "--mode=icmp", "--tries=3", "--timeout=250", "--workers", "64", "--geo-workers=2",
                           "--log=diag.txt", "--no-color", "--port=8443"});
    CHECK(o.limit == 5);
    CHECK(o.max_latency_ms && *o.max_latency_ms == 150.0);
    CHECK(o.ip_list == "ranges.txt");
    CHECK(o.out_path == "best.txt");
    CHECK(o.mode == ProbeMode::Icmp);
    CHECK(o.tries && *o.tries == 3);
    CHECK(o.timeout_ms == 250);
    CHECK(o.workers && *o.workers == 64);
    CHECK(o.geo_workers == 2);
    CHECK(o.log_path == "diag.txt");
    CHECK(o.no_color);
    CHECK(o.port == 8443);
    return true;
}

bool test_bad_input_rejected() {
    CHECK(rejects({"--limit=0"}));
    CHECK(rejects({"--limit=abc"}));
    CHECK(rejects({"--limit=5x"}));
    CHECK(rejects({"--tries=0"}));
    CHECK(rejects({"--max-latency=-3"}));
    CHECK(rejects({"--mode=udp"}));
    CHECK(rejects({"--port=70000"}));
    CHECK(rejects({"--bogus=1"}));
    CHECK(rejects({"positional"}));
    CHECK(rejects({"--out"}));
    CHECK(rejects({"--out="}));
    return true;
}

bool test_help() {
    CHECK(parse({"-h"}).help);
    CHECK(parse({"--help"}).help);
    return true;
}

bool test_mode_names() {
    CHECK(parse_mode("tcp") == ProbeMode::Tcp);
    CHECK(parse_mode("icmp") == ProbeMode::Icmp);
    CHECK(std::string(mode_name(ProbeMode::Icmp)) == "icmp");
    return true;
}

int main() {
    std::cout << "Running option parsing tests...\n";

    run_test("Defaults", test_defaults);
    run_test("Equals And Separate Values", test_equals_and_separate_values);
    run_test("Bad Input Rejected", test_bad_input_rejected);
    run_test("Help", test_help);
    run_test("Mode Names", test_mode_names);

    return finish_tests("Option parsing tests");
}
