/**
 * # build the scanner
 * cmake -S . -B build && cmake --build build
 * ./build/cfscan --limit=10 --out=best.txt
 *
 * Examples with options:
 *   ./build/cfscan --ip-list=ranges.txt --max-latency=150 --log=diag.txt
 *   sudo ./build/cfscan --mode=icmp --tries=6 --workers=50
 */

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "address_source.hpp"
#include "diag_logger.hpp"
#include "geo_resolver.hpp"
#include "icmp_echo_probe.hpp"
#include "probe_engine.hpp"
#include "renderer.hpp"
#include "results_table.hpp"
#include "scan_options.hpp"
#include "tcp_connect_probe.hpp"
#include "terminal.hpp"

using namespace std;
using namespace cfscan;

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    ScanOptions opt;
    try {
        opt = parse_options(argc, argv);
    } catch (const exception &e) {
        cerr << e.what() << "\n";
        print_usage(cerr, argv[0]);
        return 1;
    }
    if (opt.help) { print_usage(cout, argv[0]); return 0; }
    term::g_enabled = !opt.no_color;

    // Optional diagnostics
    DiagLogger diag(opt.log_path);
    DiagLogger *dptr = diag.ok() ? &diag : nullptr;
    if (!opt.log_path.empty() && !diag.ok()) {
        cerr << "Warning: couldn't open log file: " << opt.log_path << "\n";
    }

    try {
        // --- Step 1: ranges -> addresses ---
        optional<vector<string>> cidrs;
        if (opt.ip_list.empty()) {
            cout << term::colorize("Fetching Cloudflare IP ranges...", term::cyan()) << endl;
            cidrs = fetch_cloudflare_cidrs(cerr, dptr);
        } else {
            cout << term::colorize("Loading Cloudflare IP ranges from " + opt.ip_list + "...", term::cyan()) << endl;
            cidrs = load_cidrs_from_file(opt.ip_list);
        }
        if (!cidrs) return 1;

        cout << term::colorize("Expanding CIDR ranges...", term::cyan()) << endl;
        vector<string> targets = expand_cidrs(*cidrs, cerr, dptr);
        if (targets.empty()) {
            cerr << term::colorize("Error: no addresses to test.", term::red()) << "\n";
            return 1;
        }
        cout << term::colorize("Found " + to_string(targets.size()) + " unique IP addresses to test.", term::green())
             << "\n" << endl;

        // --- Step 2: probe, rank, enrich ---
        unique_ptr<ProbeStrategy> strategy;
        if (opt.mode == ProbeMode::Icmp) {
            if (!IcmpEchoProbe::available()) {
                cerr << term::colorize("Error: cannot open an ICMP socket. Run with sudo/CAP_NET_RAW "
                                       "or allow it via net.ipv4.ping_group_range.", term::red()) << "\n";
                return 1;
            }
            strategy = make_unique<IcmpEchoProbe>(dptr);
        } else {
            strategy = make_unique<TcpConnectProbe>(opt.port, dptr);
        }

        EngineConfig cfg;
        cfg.limit = opt.limit;
        cfg.max_latency_ms = opt.max_latency_ms;
        cfg.tries = opt.tries.value_or(strategy->default_tries());
        cfg.timeout = chrono::milliseconds(opt.timeout_ms);
        cfg.probe_workers = opt.workers.value_or(strategy->default_workers());
        cfg.geo_workers = opt.geo_workers;

        IpInfoGeoLookup geo(chrono::seconds(10), dptr);
        Renderer renderer(cout);
        ProbeEngine engine(*strategy, geo, cfg, &renderer, dptr);
        ScanReport report = engine.run(targets);

        // --- Step 3: persist ---
        if (!opt.out_path.empty()) {
            try {
                write_results(opt.out_path, report.leaderboard);
                cout << term::colorize("Results saved to " + opt.out_path, term::green()) << endl;
            } catch (const exception &e) {
                cerr << term::colorize(string("Error saving results: ") + e.what(), term::red()) << "\n";
                return 1;
            }
        }
        return 0;
    } catch (const exception &e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
