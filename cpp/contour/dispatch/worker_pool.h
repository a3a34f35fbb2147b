#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace contour::dispatch {

namespace detail {
inline bool& workerFlag() {
    thread_local bool flag = false;
    return flag;
}
} // namespace detail

// True on a thread owned by any WorkerPool.
inline bool onWorkerThread() noexcept { return detail::workerFlag(); }

// Fixed-size FIFO thread pool. Tasks already queued when the pool shuts down
// still run before the workers join.
class WorkerPool {
public:
    // Throws std::system_error if a thread cannot be started and
    // std::length_error or std::bad_alloc for absurd counts. Threads that did
    // start are joined first.
    WorkerPool(std::string name, std::size_t threads) : name_(std::move(name)) {
        const std::size_t n = threads > 0 ? threads : 1;
        workers_.reserve(n);
        try {
            for (std::size_t i = 0; i < n; ++i) {
                workers_.emplace_back([this] { workerLoop(); });
            }
        } catch (...) {
            shutdown();
            throw;
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> res = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("WorkerPool " + name_ + ": submit after shutdown");
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return res;
    }

    // Idempotent. Must not be called from one of this pool's own workers.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    std::size_t threadCount() const noexcept { return workers_.size(); }
    const std::string& name() const noexcept { return name_; }

private:
    void workerLoop() {
        detail::workerFlag() = true;
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_{false};
};

} // namespace contour::dispatch
