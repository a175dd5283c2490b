#include "address_source.hpp"
#include "terminal.hpp"
#include "test_harness.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace cfscan;

bool test_small_block_expands_fully() {
    std::ostringstream warn;
    auto ips = expand_cidrs({"104.16.0.0/30"}, warn);
    CHECK(ips.size() == 4);
    CHECK(ips.front() == "104.16.0.0"); // network address included
    CHECK(ips.back() == "104.16.0.3");  // and broadcast
    CHECK(warn.str().empty());

    CHECK(expand_cidrs({"198.41.128.0/24"}, warn).size() == 256);
    return true;
}

bool test_large_block_samples_every_sixteenth() {
    std::ostringstream warn;
    auto ips = expand_cidrs({"173.245.48.0/20"}, warn);
    CHECK(ips.size() == 4096 / 16);
    CHECK(ips[0] == "173.245.48.0");
    CHECK(ips[1] == "173.245.48.16");
    CHECK(ips.back() == "173.245.63.240");

    CHECK(expand_cidrs({"10.0.0.0/23"}, warn).size() == 32);
    return true;
}

bool test_bare_address_is_host_route() {
    std::ostringstream warn;
    auto ips = expand_cidrs({"1.1.1.1"}, warn);
    CHECK(ips.size() == 1 && ips[0] == "1.1.1.1");
    return true;
}

bool test_bad_entries_warn_and_skip() {
    std::ostringstream warn;
    auto ips = expand_cidrs({"10.0.0.1/24", "999.1.1.1/32", "10.0.0.0/33", "garbage", "10.0.0.0/x", "10.0.0.4/31"}, warn);
    CHECK(ips.size() == 2);
    CHECK(ips[0] == "10.0.0.4" && ips[1] == "10.0.0.5");
    CHECK(warn.str().find("10.0.0.1/24") != std::string::npos);
    CHECK(warn.str().find("garbage") != std::string::npos);
    return true;
}

bool test_overlap_is_deduplicated_and_sorted() {
    std::ostringstream warn;
    auto ips = expand_cidrs({"10.0.0.2/31", "10.0.0.0/30", "9.255.255.255"}, warn);
    CHECK(ips.size() == 5);
    CHECK(ips[0] == "9.255.255.255");
    CHECK(ips[1] == "10.0.0.0");
    CHECK(ips[4] == "10.0.0.3");
    return true;
}

bool test_split_list() {
    auto v = split_cidr_list(" 1.0.0.0/24,2.0.0.0/24\n\n 3.0.0.0/24 ,\r\n4.0.0.0/24");
    CHECK(v.size() == 4);
    CHECK(v[0] == "1.0.0.0/24");
    CHECK(v[2] == "3.0.0.0/24");
    CHECK(v[3] == "4.0.0.0/24");
    return true;
}

bool test_load_file() {
    const std::string path = "cfscan_ranges_test.txt";
    {
        std::ofstream out(path);
        out << "104.16.0.0/30,\n172.64.0.0/30\n";
    }
    auto v = load_cidrs_from_file(path);
    std::remove(path.c_str());
    CHECK(v.size() == 2);
    CHECK(v[1] == "172.64.0.0/30");

    try {
        load_cidrs_from_file("/nonexistent/ranges.txt");
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

bool test_parse_api_response() {
    const std::string ok =
        "{\"result\":{\"ipv4_cidrs\":[\"173.245.48.0/20\",\"103.21.244.0/22\"],"
        "\"ipv6_cidrs\":[\"2400:cb00::/32\"],\"etag\":\"abc\"},\"success\":true,\"errors\":[],\"messages\":[]}";
    auto v = parse_cloudflare_ips(ok);
    CHECK(v && v->size() == 2);
    CHECK((*v)[0] == "173.245.48.0/20");

    CHECK(!parse_cloudflare_ips("{\"success\":false,\"errors\":[{\"code\":1}]}"));
    CHECK(!parse_cloudflare_ips("{\"success\": true, \"result\": {}}"));
    return true;
}

int main() {
    term::g_enabled = false;
    std::cout << "Running address source tests...\n";

    run_test("Small Block Expands Fully", test_small_block_expands_fully);
    run_test("Large Block Samples Every 16th", test_large_block_samples_every_sixteenth);
    run_test("Bare Address", test_bare_address_is_host_route);
    run_test("Bad Entries Skipped", test_bad_entries_warn_and_skip);
    run_test("Overlap Deduplicated", test_overlap_is_deduplicated_and_sorted);
    run_test("Split List", test_split_list);
    run_test("Load File", test_load_file);
    run_test("Parse API Response", test_parse_api_response);

    return finish_tests("Address source tests");
}
