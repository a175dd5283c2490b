// ===================== include/progress_tracker.hpp =====================
#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>

namespace cfscan {

struct ProgressState {
    std::size_t tested_count{0};
    std::size_t total_count{0};
    std::chrono::duration<double> elapsed{};
    std::chrono::duration<double> estimated_remaining{};

    bool finished() const { return tested_count == total_count; }
};

// Completion counter plus an EWMA of seconds-per-item for the ETA.
// The time point overloads exist so tests can drive the clock.
class ProgressTracker {
public:
    using clk = std::chrono::steady_clock;

    static constexpr double kAlpha = 0.95;

    explicit ProgressTracker(std::size_t total_count);
    ProgressTracker(std::size_t total_count, clk::time_point start);

    // +1 tested, regardless of outcome. Returns true on the completion that
    // reaches total_count. Throws std::logic_error past total_count.
    bool record_completion();
    bool record_completion(clk::time_point now);

    ProgressState snapshot() const;
    ProgressState snapshot(clk::time_point now) const;

    double rate() const; // seconds per item, 0 before the first completion

private:
    mutable std::mutex mu_;
    const std::size_t total_;
    std::size_t tested_{0};
    clk::time_point start_;
    clk::time_point prev_;
    double rate_{0.0};
};

} // namespace cfscan
