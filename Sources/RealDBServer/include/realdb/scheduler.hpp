#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <mutex>
#include <queue>
#include <vector>
#include <condition_variable>
#include <atomic>

namespace realdb {

// ============================================================================
// Scheduler interface - where connection work runs
// ============================================================================
//
// The TCP server hands every accepted connection to a scheduler. The default
// is a worker_pool; tests can use immediate_scheduler to serve connections on
// the accept thread itself.

struct scheduler {
    virtual ~scheduler() = default;

    // Run fn on this scheduler's execution context. Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is running on one of this scheduler's threads.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if invoke() is currently possible.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using SharedScheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Worker pool - fixed set of threads draining one FIFO queue
// ============================================================================

class worker_pool : public scheduler {
public:
    explicit worker_pool(size_t size) : running_(true) {
        if (size == 0) size = 1;
        workers_.reserve(size);
        for (size_t i = 0; i < size; ++i) {
            workers_.emplace_back([this] { run_loop(); });
        }
    }

    // Pending work is drained before the threads exit.
    ~worker_pool() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Work offered after shutdown is destroyed unrun
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        auto self = std::this_thread::get_id();
        for (const auto& worker : workers_) {
            if (worker.get_id() == self) return true;
        }
        return false;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

    size_t size() const { return workers_.size(); }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
            }

            if (fn) {
                fn();
            }
        }
    }

    std::vector<std::thread> workers_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// Immediate scheduler - runs work synchronously on the calling thread
// ============================================================================
//
// Useful for testing or single-threaded serving.

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;  // Always "on thread" since we execute immediately
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

} // namespace realdb
