// ===================== src/progress_tracker.cpp =====================
#include "progress_tracker.hpp"

#include <stdexcept>

namespace cfscan {

ProgressTracker::ProgressTracker(std::size_t total_count)
    : ProgressTracker(total_count, clk::now()) {}

ProgressTracker::ProgressTracker(std::size_t total_count, clk::time_point start)
    : total_(total_count), start_(start), prev_(start) {}

bool ProgressTracker::record_completion() { return record_completion(clk::now()); }

bool ProgressTracker::record_completion(clk::time_point now) {
    std::lock_guard<std::mutex> lock(mu_);
    if (tested_ >= total_)
        throw std::logic_error("completion recorded past total (" + std::to_string(total_) + ")");

    double dt = std::chrono::duration<double>(now - prev_).count();
    ++tested_;
    rate_ = (tested_ == 1) ? dt : kAlpha * rate_ + (1.0 - kAlpha) * dt;
    prev_ = now;
    return tested_ == total_;
}

ProgressState ProgressTracker::snapshot() const { return snapshot(clk::now()); }

ProgressState ProgressTracker::snapshot(clk::time_point now) const {
    std::lock_guard<std::mutex> lock(mu_);
    ProgressState s;
    s.tested_count = tested_;
    s.total_count = total_;
    s.elapsed = now - start_;
    s.estimated_remaining = std::chrono::duration<double>(static_cast<double>(total_ - tested_) * rate_);
    return s;
}

double ProgressTracker::rate() const {
    std::lock_guard<std::mutex> lock(mu_);
    return rate_;
}

} // namespace cfscan
