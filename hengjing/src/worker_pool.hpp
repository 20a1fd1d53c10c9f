#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace hengjing::popup {

/**
 * Threads reserved for blocking work (child processes, file I/O) so it never
 * runs on a thread that serves sockets.
 *
 * The pool starts with min_threads and adds a thread whenever a task is
 * queued while every worker is busy, up to max_threads. A task that blocks
 * on a human therefore never holds back a later task unless the cap is hit.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t min_threads = 1, size_t max_threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue fn; its result or exception is delivered through the future
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_) {
                throw std::runtime_error("WorkerPool is stopped");
            }
            task_queue_.push([task] { (*task)(); });
            grow_locked();
        }
        queue_cv_.notify_one();
        return result;
    }

    /// Finishes queued tasks, then joins the workers
    void stop();

    size_t size() const;
    size_t max_size() const { return max_threads_; }

private:
    void grow_locked();
    void worker_thread_func();

    const size_t max_threads_;
    std::vector<std::thread> worker_threads_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    size_t idle_workers_ = 0;
    bool running_ = true;
};

} // namespace hengjing::popup
