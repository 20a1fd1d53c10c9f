#pragma once

#include "protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace hengjing::ipc {

/**
 * Bounded multi-producer queue carrying newly arrived requests from the
 * socket server to whatever shows them to the user.
 */
class RequestChannel {
public:
    explicit RequestChannel(size_t capacity = 32);

    RequestChannel(const RequestChannel&) = delete;
    RequestChannel& operator=(const RequestChannel&) = delete;

    /// Blocks while the channel is full; false once the channel is closed
    bool send(Request request);

    /// Blocks until a request arrives; nullopt once closed and drained
    std::optional<Request> receive();

    std::optional<Request> receive_for(std::chrono::milliseconds timeout);

    void close();
    bool is_closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    std::optional<Request> pop_locked();

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Request> queue_;
    bool closed_ = false;
};

} // namespace hengjing::ipc
