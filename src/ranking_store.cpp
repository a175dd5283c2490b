// ===================== src/ranking_store.cpp =====================
#include "ranking_store.hpp"

#include <algorithm>
#include <stdexcept>

namespace cfscan {

RankingStore::RankingStore(std::size_t limit) : limit_(limit) {
    if (limit_ == 0) throw std::invalid_argument("leaderboard limit must be at least 1");
    entries_.reserve(limit_ + 1);
}

bool RankingStore::offer(const std::string &address, Latency latency) {
    std::lock_guard<std::mutex> lock(mu_);
    if (entries_.size() >= limit_ && !(latency < entries_.back().latency))
        return false;

    // upper_bound puts the newcomer after any equal latency: stable order.
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), latency,
                                [](Latency l, const RankEntry &e) { return l < e.latency; });
    entries_.insert(pos, RankEntry{address, latency, std::nullopt});
    if (entries_.size() > limit_) entries_.pop_back();
    dirty_ = true;
    return true;
}

bool RankingStore::apply(const LocationUpdate &update) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const RankEntry &e) { return e.address == update.address; });
    if (it == entries_.end()) return false;
    it->location = update.location;
    dirty_ = true;
    return true;
}

std::vector<RankEntry> RankingStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
}

std::optional<std::vector<RankEntry>> RankingStore::take_if_dirty() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!dirty_) return std::nullopt;
    dirty_ = false;
    return entries_;
}

bool RankingStore::dirty() const {
    std::lock_guard<std::mutex> lock(mu_);
    return dirty_;
}

std::size_t RankingStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

} // namespace cfscan
