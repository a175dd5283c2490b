// ===================== src/results_table.cpp =====================
#include "results_table.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cfscan {

std::string pad_right(const std::string &s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

std::string format_latency(Latency l) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << l.count();
    return oss.str();
}

std::string format_duration(double seconds) {
    long total = seconds > 0 ? static_cast<long>(std::ceil(seconds)) : 0;
    long h = total / 3600;
    long m = (total % 3600) / 60;
    long s = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (h > 0)
        oss << h << "h " << std::setw(2) << m << "m " << std::setw(2) << s << "s";
    else if (m > 0)
        oss << m << "m " << std::setw(2) << s << "s";
    else
        oss << s << "s";
    return oss.str();
}

std::string table_header() {
    return pad_right("Rank", kRankWidth) + pad_right("IP Address", kAddressWidth) +
           pad_right("Location", kLocationWidth) + pad_right("Latency (ms)", kLatencyWidth);
}

std::string table_separator() { return std::string(kSeparatorWidth, '-'); }

std::string table_row_prefix(std::size_t rank, const RankEntry &e, const std::string &pending) {
    return pad_right(std::to_string(rank), kRankWidth) + pad_right(e.address, kAddressWidth) +
           pad_right(e.location.value_or(pending), kLocationWidth);
}

void write_results(const std::string &path, const std::vector<RankEntry> &entries) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        throw std::runtime_error("cannot open " + path + ": " + std::strerror(errno));

    out << table_header() << '\n' << table_separator() << '\n';
    std::size_t rank = 1;
    for (const auto &e : entries)
        out << table_row_prefix(rank++, e, "N/A") << format_latency(e.latency) << '\n';

    out.flush();
    if (!out)
        throw std::runtime_error("write to " + path + " failed");
}

} // namespace cfscan
