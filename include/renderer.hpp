// ===================== include/renderer.hpp =====================
#pragma once
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "progress_tracker.hpp"
#include "ranking_store.hpp"

namespace cfscan {

// Repaints the leaderboard and progress lines in place by erasing exactly
// what the previous call wrote. Single writer: call from one thread only.
class Renderer {
public:
    static constexpr std::size_t kBarWidth = 40;

    explicit Renderer(std::ostream &out) : out_(out) {}

    // `table` is the leaderboard when it changed since the last call (dirty),
    // nullopt to leave the table region untouched. The progress region is
    // always redrawn; a `status` message replaces the progress bar.
    void render(const std::optional<std::vector<RankEntry>> &table,
                const ProgressState &progress,
                const std::optional<std::string> &status = std::nullopt);

    std::size_t table_lines() const { return prev_table_lines_; }
    std::size_t status_lines() const { return prev_status_lines_; }

    static std::string progress_bar(std::size_t tested, std::size_t total);

private:
    std::ostream &out_;
    std::size_t prev_table_lines_{0};
    std::size_t prev_status_lines_{0};
};

} // namespace cfscan
