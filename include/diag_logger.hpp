// ===================== File: include/diag_logger.hpp =====================
#pragma once
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace cfscan {

// Append-only diagnostics file shared by the probe pool, the geo pool and the
// scan loop. Each record is tagged with a small per-thread ordinal so lines
// from concurrent workers can be told apart.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    void log(const std::string& line);

private:
    std::mutex mu_;
    std::ofstream out_;
    std::size_t records_ = 0;
};

} // namespace cfscan
