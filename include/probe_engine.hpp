// ===================== include/probe_engine.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "probe_strategy.hpp"
#include "ranking_store.hpp"

namespace cfscan {

class DiagLogger;
class GeoLookup;
class Renderer;

struct ProbeOutcome {
    std::string target;
    std::optional<Latency> latency; // nullopt = unreachable
};

struct EngineConfig {
    std::size_t limit{20};
    std::optional<double> max_latency_ms; // admit only strictly below
    int tries{4};
    std::chrono::milliseconds timeout{1000};
    std::size_t probe_workers{10};
    std::size_t geo_workers{5};
};

struct ScanReport {
    std::vector<RankEntry> leaderboard;
    std::size_t tested{0};
    std::size_t unreachable{0};
    std::size_t filtered{0};     // reachable but not below max latency
    std::size_t admitted{0};
    std::size_t stale_updates{0}; // lookups that finished after eviction
};

// Probes every target exactly once on a fixed pool, ranks the results and
// enriches admitted entries on a second pool. run() returns only after every
// probe and then every lookup has completed; there is no early exit.
class ProbeEngine {
public:
    ProbeEngine(ProbeStrategy &strategy, GeoLookup &geo, EngineConfig cfg,
                Renderer *renderer = nullptr, DiagLogger *diag = nullptr);

    ScanReport run(const std::vector<std::string> &targets);

private:
    ProbeStrategy &strategy_;
    GeoLookup &geo_;
    EngineConfig cfg_;
    Renderer *renderer_;
    DiagLogger *diag_;
};

} // namespace cfscan
