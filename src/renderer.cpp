// ===================== src/renderer.cpp =====================
#include "renderer.hpp"
#include "results_table.hpp"
#include "terminal.hpp"

namespace cfscan {

namespace {

const char *latency_color(Latency l) {
    if (l.count() < 100) return term::green();
    if (l.count() < 200) return term::yellow();
    return term::red();
}

} // namespace

std::string Renderer::progress_bar(std::size_t tested, std::size_t total) {
    std::size_t filled = total > 0 ? tested * kBarWidth / total : 0;
    if (filled > kBarWidth) filled = kBarWidth;

    std::string bar = "[";
    for (std::size_t i = 0; i < filled; ++i) bar += "\xe2\x96\x88"; // U+2588 full block
    bar += std::string(kBarWidth - filled, '-');
    bar += "]";
    return bar;
}

void Renderer::render(const std::optional<std::vector<RankEntry>> &table,
                      const ProgressState &progress,
                      const std::optional<std::string> &status) {
    std::vector<std::string> table_lines;
    if (table) {
        table_lines.push_back(std::string(term::bold()) + term::header() + table_header() + term::reset());
        table_lines.push_back(table_separator());
        std::size_t rank = 1;
        for (const auto &e : *table)
            table_lines.push_back(table_row_prefix(rank++, e, "...") + latency_color(e.latency) +
                                  pad_right(format_latency(e.latency), kLatencyWidth) + term::reset());
    }

    std::vector<std::string> status_lines;
    status_lines.emplace_back(); // spacer
    if (status) {
        status_lines.push_back(*status);
    } else {
        status_lines.push_back(std::string(term::yellow()) + "Scanning Progress: " + term::reset() +
                               progress_bar(progress.tested_count, progress.total_count) +
                               term::yellow() + " " + std::to_string(progress.tested_count) + "/" +
                               std::to_string(progress.total_count) + term::reset());
        status_lines.push_back(term::colorize("Time elapsed: " + format_duration(progress.elapsed.count()) +
                                                  "  Estimated time remaining: " +
                                                  format_duration(progress.estimated_remaining.count()),
                                              term::yellow()));
    }

    // Only the regions being redrawn are erased; an unchanged table stays put.
    std::size_t to_clear = table ? prev_table_lines_ + prev_status_lines_ : prev_status_lines_;

    std::string buf;
    for (std::size_t i = 0; i < to_clear; ++i) buf += term::erase_line_above();
    for (const auto &l : table_lines) buf += l + "\n";
    for (const auto &l : status_lines) buf += l + "\n";

    out_ << buf;
    out_.flush();

    if (table) prev_table_lines_ = table_lines.size();
    prev_status_lines_ = status_lines.size();
}

} // namespace cfscan
