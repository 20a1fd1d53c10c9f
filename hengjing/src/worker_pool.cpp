#include "worker_pool.hpp"

#include <algorithm>

namespace hengjing::popup {

WorkerPool::WorkerPool(size_t min_threads, size_t max_threads)
    : max_threads_(std::max<size_t>({min_threads, max_threads, 1})) {
    if (min_threads == 0) {
        min_threads = 1;
    }
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (size_t i = 0; i < min_threads; ++i) {
        worker_threads_.emplace_back(&WorkerPool::worker_thread_func, this);
        ++idle_workers_;
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::grow_locked() {
    if (task_queue_.size() > idle_workers_ && worker_threads_.size() < max_threads_) {
        worker_threads_.emplace_back(&WorkerPool::worker_thread_func, this);
        ++idle_workers_;
    }
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();

    // No thread is added once running_ is false
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

size_t WorkerPool::size() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return worker_threads_.size();
}

void WorkerPool::worker_thread_func() {
    // A new worker counts as idle from the moment it is spawned
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !running_; });

        if (!running_ && task_queue_.empty()) {
            --idle_workers_;
            return;
        }

        std::function<void()> task = std::move(task_queue_.front());
        task_queue_.pop();
        --idle_workers_;

        lock.unlock();
        task();
        lock.lock();
        ++idle_workers_;
    }
}

} // namespace hengjing::popup
