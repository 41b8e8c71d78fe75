#pragma once

#include "errors.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// WorkerPool — fixed set of threads draining a FIFO job queue.
//
// Jobs must not throw. The destructor finishes every queued job before
// joining.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(int num_workers) {
        if (num_workers <= 0) {
            throw InvalidConfiguration("worker count must be > 0, got " +
                                       std::to_string(num_workers));
        }
        workers_.reserve(static_cast<size_t>(num_workers));
        for (int i = 0; i < num_workers; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    void submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            pending_.push(std::move(job));
        }
        work_cv_.notify_one();
    }

    // Blocks until the queue is empty and no job is running.
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mu_);
        idle_cv_.wait(lock, [this] { return pending_.empty() && active_ == 0; });
    }

    int size() const { return static_cast<int>(workers_.size()); }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mu_);
                work_cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                if (pending_.empty()) return;  // stopping and drained
                job = std::move(pending_.front());
                pending_.pop();
                ++active_;
            }
            job();
            {
                std::lock_guard<std::mutex> lock(mu_);
                --active_;
                if (pending_.empty() && active_ == 0) idle_cv_.notify_all();
            }
        }
    }

    std::mutex mu_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void()>> pending_;
    std::vector<std::thread> workers_;
    int active_ = 0;
    bool stopping_ = false;
};
