#include "broker_state.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hengjing::ipc {

BrokerState::BrokerState(std::shared_ptr<RequestChannel> channel)
    : channel_(channel ? std::move(channel) : std::make_shared<RequestChannel>()) {}

BrokerState::~BrokerState() = default;

void BrokerState::set_pending(Request request, std::promise<std::string> resolver) {
    std::optional<PendingRequest> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            LOG4CPLUS_WARN(server_logger(), "Broker is shut down, cancelling request " << request.id);
            return;
        }
        if (pending_) {
            LOG4CPLUS_WARN(server_logger(), "Request " << pending_->request.id << " replaced by " << request.id
                                                       << " before it was answered");
            replaced = std::move(pending_);
        }
        pending_ = PendingRequest{std::move(request), std::move(resolver)};
    }
    // replaced (if any) is destroyed here, breaking its promise
}

void BrokerState::resolve(const std::string& request_id, std::string answer) {
    std::optional<PendingRequest> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pending_) {
            throw NothingPendingError("No request is waiting for a response");
        }
        if (pending_->request.id != request_id) {
            LOG4CPLUS_WARN(server_logger(), "Response for " << request_id << " does not match pending request "
                                                            << pending_->request.id);
            throw MismatchError("Request id mismatch: pending '" + pending_->request.id + "', got '" +
                                request_id + "'");
        }
        entry = std::move(pending_);
        pending_.reset();
    }

    LOG4CPLUS_INFO(server_logger(), "Delivering response for " << request_id);
    entry->resolver.set_value(std::move(answer));
}

std::optional<std::string> BrokerState::pending_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) {
        return std::nullopt;
    }
    return pending_->request.id;
}

bool BrokerState::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

void BrokerState::shutdown() {
    std::optional<PendingRequest> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        dropped = std::move(pending_);
        pending_.reset();
    }
    channel_->close();
}

bool BrokerState::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

} // namespace hengjing::ipc
