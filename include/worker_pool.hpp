// ===================== include/worker_pool.hpp =====================
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace cfscan {

// Unbounded, closeable FIFO. push() never blocks, so producers on the
// coordinating thread can hand work off without waiting on consumers.
template <typename T>
class Channel {
public:
    // false once the channel is closed; the item is dropped.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(item));
        }
        not_empty_cv_.notify_one();
        return true;
    }

    // Blocks until an item arrives; nullopt only when closed and drained.
    std::optional<T> wait_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T out = std::move(queue_.front());
        queue_.pop_front();
        return out;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        T out = std::move(queue_.front());
        queue_.pop_front();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable not_empty_cv_;
    std::deque<T> queue_;
    bool closed_{false};
};

// Fixed number of threads applying `fn` to submitted inputs. Every result is
// delivered through one channel read by a single consumer, which also does
// the submitting; submit()/next()/pending() belong to that thread.
//
// `fn` must not throw: an exception escaping a worker terminates the process.
template <typename Input, typename Result>
class WorkerPool {
public:
    using Fn = std::function<Result(const Input &)>;

    WorkerPool(std::size_t workers, Fn fn) : fn_(std::move(fn)) {
        if (workers == 0) throw std::invalid_argument("WorkerPool needs at least one worker");
        threads_.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
            threads_.emplace_back([this] { run(); });
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    void submit(Input in) {
        if (!tasks_.push(std::move(in)))
            throw std::logic_error("submit() on a pool that was shut down");
        ++submitted_;
    }

    // Blocks for the next completed result, in completion order.
    Result next() {
        if (pending() == 0) throw std::logic_error("next() with nothing in flight");
        auto r = results_.wait_pop();
        if (!r) throw std::logic_error("result channel closed with work in flight");
        ++delivered_;
        return std::move(*r);
    }

    std::optional<Result> try_next() {
        auto r = results_.try_pop();
        if (r) ++delivered_;
        return r;
    }

    std::size_t pending() const { return submitted_ - delivered_; }
    std::size_t size() const { return threads_.size(); }

    // Lets queued inputs finish, then joins every worker. Idempotent.
    void shutdown() {
        tasks_.close();
        for (auto &t : threads_)
            if (t.joinable()) t.join();
    }

private:
    void run() {
        while (auto in = tasks_.wait_pop())
            results_.push(fn_(*in));
    }

    Fn fn_;
    Channel<Input> tasks_;
    Channel<Result> results_;
    std::vector<std::thread> threads_;
    std::size_t submitted_{0};
    std::size_t delivered_{0};
};

} // namespace cfscan
