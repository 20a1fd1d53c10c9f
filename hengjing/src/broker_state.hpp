#pragma once

#include "protocol.hpp"
#include "request_channel.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hengjing::ipc {

/// The one request currently waiting for a human, and where its answer goes
struct PendingRequest {
    Request request;
    std::promise<std::string> resolver;
};

/**
 * Single-slot correlation between a waiting connection and the answer the
 * UI delivers for it.
 *
 * At most one request is pending at any time. set_pending() replaces an
 * unresolved entry and logs a warning; the replaced resolver is destroyed, so
 * its connection sees a broken promise and answers with a cancellation.
 * Callers that need several questions in flight must serialize them above
 * this class.
 */
class BrokerState {
public:
    explicit BrokerState(std::shared_ptr<RequestChannel> channel);
    ~BrokerState();

    BrokerState(const BrokerState&) = delete;
    BrokerState& operator=(const BrokerState&) = delete;

    void set_pending(Request request, std::promise<std::string> resolver);

    /**
     * Delivers answer to the pending request.
     *
     * Throws NothingPendingError when the slot is empty. Throws MismatchError
     * when the pending id differs; the pending entry stays in place and can
     * still be resolved with its own id.
     */
    void resolve(const std::string& request_id, std::string answer);

    std::shared_ptr<RequestChannel> notify_channel() const { return channel_; }

    std::optional<std::string> pending_id() const;
    bool has_pending() const;

    /// Drops the pending resolver and closes the notify channel
    void shutdown();
    bool is_shut_down() const;

private:
    std::shared_ptr<RequestChannel> channel_;
    mutable std::mutex mutex_;
    std::optional<PendingRequest> pending_;
    bool shut_down_ = false;
};

} // namespace hengjing::ipc
