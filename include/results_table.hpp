// ===================== include/results_table.hpp =====================
#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "ranking_store.hpp"

namespace cfscan {

// Column widths shared by the live table and the saved file.
inline constexpr std::size_t kRankWidth = 8;
inline constexpr std::size_t kAddressWidth = 18;
inline constexpr std::size_t kLocationWidth = 30;
inline constexpr std::size_t kLatencyWidth = 10;
inline constexpr std::size_t kSeparatorWidth = 70;

std::string pad_right(const std::string &s, std::size_t width);
std::string format_latency(Latency l); // "12.34"

// Seconds rounded up: "1h 02m 03s", "4m 05s" or "6s".
std::string format_duration(double seconds);

std::string table_header();
std::string table_separator();

// Rank, address and location columns of one row; `pending` stands in for a
// location that has not resolved yet.
std::string table_row_prefix(std::size_t rank, const RankEntry &e, const std::string &pending);

// Fixed-width table of the final leaderboard. Throws std::runtime_error when
// `path` cannot be written.
void write_results(const std::string &path, const std::vector<RankEntry> &entries);

} // namespace cfscan
