// ===================== File: src/diag_logger.cpp =====================
#include "diag_logger.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cfscan {

namespace {

std::string stamp() {
    using namespace std::chrono;
    const auto t  = system_clock::now();
    const auto tt = system_clock::to_time_t(t);
    const auto ms = duration_cast<milliseconds>(t.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

// 0 is whichever thread logs first (normally main).
unsigned thread_ordinal() {
    static std::atomic<unsigned> next{0};
    thread_local const unsigned mine = next++;
    return mine;
}

} // namespace

DiagLogger::DiagLogger(const std::string& path)
{
    if (path.empty()) return;
    out_.open(path, std::ios::app);
    if (!out_.is_open()) return;
    out_ << "=== cfscan diag start " << stamp() << " ===\n";
    out_.flush();
}

DiagLogger::~DiagLogger()
{
    if (!out_.is_open()) return;
    out_ << "=== cfscan diag end " << stamp() << " records=" << records_ << " ===\n";
}

void DiagLogger::log(const std::string& line)
{
    if (!out_.is_open()) return;
    const unsigned tid = thread_ordinal();
    std::lock_guard<std::mutex> lock(mu_);
    out_ << stamp() << " [t" << tid << "] | " << line << '\n';
    out_.flush();
    ++records_;
}

} // namespace cfscan
