// ===================== src/probe_engine.cpp =====================
#include "probe_engine.hpp"
#include "diag_logger.hpp"
#include "geo_resolver.hpp"
#include "progress_tracker.hpp"
#include "renderer.hpp"
#include "terminal.hpp"
#include "worker_pool.hpp"

#include <stdexcept>

namespace cfscan {

ProbeEngine::ProbeEngine(ProbeStrategy &strategy, GeoLookup &geo, EngineConfig cfg,
                         Renderer *renderer, DiagLogger *diag)
    : strategy_(strategy), geo_(geo), cfg_(cfg), renderer_(renderer), diag_(diag) {
    if (cfg_.tries < 1) throw std::invalid_argument("tries must be at least 1");
    if (cfg_.probe_workers == 0 || cfg_.geo_workers == 0)
        throw std::invalid_argument("worker pools need at least one worker");
}

ScanReport ProbeEngine::run(const std::vector<std::string> &targets) {
    RankingStore store(cfg_.limit);
    ProgressTracker progress(targets.size());
    ScanReport report;

    const std::string waiting = term::colorize("Waiting for location lookups to finish...", term::yellow());
    const std::string complete = term::colorize("Scanning complete.", term::green());

    if (diag_)
        diag_->log(std::string("SCAN_START mode=") + strategy_.name() + " targets=" + std::to_string(targets.size()) +
                   " limit=" + std::to_string(cfg_.limit) + " tries=" + std::to_string(cfg_.tries) +
                   " timeout_ms=" + std::to_string(cfg_.timeout.count()) +
                   " workers=" + std::to_string(cfg_.probe_workers) + "/" + std::to_string(cfg_.geo_workers));

    auto apply_update = [&](const LocationUpdate &u) {
        if (!store.apply(u)) {
            ++report.stale_updates;
            if (diag_) diag_->log("GEO_STALE addr=" + u.address + " (evicted before lookup finished)");
        }
    };
    auto paint = [&](const std::optional<std::string> &status) {
        if (renderer_) renderer_->render(store.take_if_dirty(), progress.snapshot(), status);
    };

    WorkerPool<std::string, LocationUpdate> geo_pool(
        cfg_.geo_workers, [this](const std::string &addr) { return LocationUpdate{addr, geo_.resolve(addr)}; });

    {
        WorkerPool<std::string, ProbeOutcome> probe_pool(
            cfg_.probe_workers, [this](const std::string &addr) {
                return ProbeOutcome{addr, strategy_.probe(addr, cfg_.tries, cfg_.timeout)};
            });

        for (const auto &t : targets) probe_pool.submit(t);

        // (1) every probe completes, in whatever order the pool finishes them
        while (probe_pool.pending() > 0) {
            ProbeOutcome o = probe_pool.next();
            bool finished = progress.record_completion();
            ++report.tested;

            if (!o.latency) {
                ++report.unreachable;
            } else if (cfg_.max_latency_ms && !(o.latency->count() < *cfg_.max_latency_ms)) {
                ++report.filtered;
            } else if (store.offer(o.target, *o.latency)) {
                ++report.admitted;
                geo_pool.submit(o.target);
                if (diag_) diag_->log("ADMIT addr=" + o.target + " latency_ms=" + std::to_string(o.latency->count()));
            }

            while (auto u = geo_pool.try_next()) apply_update(*u);
            paint(finished ? std::optional<std::string>(waiting) : std::nullopt);
        }
    }

    // (2) only then drain the lookups already scheduled
    while (geo_pool.pending() > 0) {
        apply_update(geo_pool.next());
        paint(waiting);
    }
    geo_pool.shutdown();

    // (3) final render
    paint(complete);

    report.leaderboard = store.snapshot();
    if (diag_)
        diag_->log("SCAN_DONE tested=" + std::to_string(report.tested) +
                   " unreachable=" + std::to_string(report.unreachable) +
                   " filtered=" + std::to_string(report.filtered) +
                   " admitted=" + std::to_string(report.admitted) +
                   " stale_geo=" + std::to_string(report.stale_updates) +
                   " ranked=" + std::to_string(report.leaderboard.size()));
    return report;
}

} // namespace cfscan
