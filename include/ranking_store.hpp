// ===================== include/ranking_store.hpp =====================
#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "probe_strategy.hpp"

namespace cfscan {

struct RankEntry {
    std::string address;
    Latency latency{};
    std::optional<std::string> location; // nullopt while the lookup is pending
};

// Result of one enrichment task, applied by the scan loop.
struct LocationUpdate {
    std::string address;
    std::string location;
};

// Bounded leaderboard of the `limit` lowest latencies seen so far, ascending.
// Equal latencies keep arrival order. Every member takes the same lock.
class RankingStore {
public:
    explicit RankingStore(std::size_t limit);

    // Admits when there is room or `latency` is strictly below the current
    // worst entry; may evict that entry. Returns whether it was admitted.
    bool offer(const std::string &address, Latency latency);

    // Fills in the location of a ranked entry. An address that has since
    // been evicted is left alone and false is returned.
    bool apply(const LocationUpdate &update);

    std::vector<RankEntry> snapshot() const;

    // Snapshot and clear the dirty flag, or nullopt if nothing changed
    // since the last call.
    std::optional<std::vector<RankEntry>> take_if_dirty();

    bool dirty() const;
    std::size_t size() const;
    std::size_t limit() const { return limit_; }

private:
    mutable std::mutex mu_;
    const std::size_t limit_;
    std::vector<RankEntry> entries_;
    bool dirty_{false};
};

} // namespace cfscan
