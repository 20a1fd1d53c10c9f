#include "request_channel.hpp"

namespace hengjing::ipc {

RequestChannel::RequestChannel(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

bool RequestChannel::send(Request request) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
        return false;
    }
    queue_.push_back(std::move(request));
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<Request> RequestChannel::pop_locked() {
    if (queue_.empty()) {
        return std::nullopt;
    }
    Request request = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return request;
}

std::optional<Request> RequestChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    return pop_locked();
}

std::optional<Request> RequestChannel::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    return pop_locked();
}

void RequestChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool RequestChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t RequestChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace hengjing::ipc
