#pragma once

#include "broker_state.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "ipc_server.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hengjing::ui {

/// Drains the notify channel and publishes each request on every channel
class RequestForwarder {
public:
    RequestForwarder(std::shared_ptr<ipc::RequestChannel> channel,
                     EventBus& bus,
                     std::vector<std::string> event_channels);
    ~RequestForwarder();

    RequestForwarder(const RequestForwarder&) = delete;
    RequestForwarder& operator=(const RequestForwarder&) = delete;

    void start();

    /// Returns once the channel is closed and drained
    void join();

    size_t forwarded_count() const { return forwarded_.load(); }

private:
    void run();

    std::shared_ptr<ipc::RequestChannel> channel_;
    EventBus& bus_;
    std::vector<std::string> event_channels_;
    std::thread thread_;
    std::atomic<size_t> forwarded_{0};
};

/**
 * Everything a front-end process needs to take requests from the backend:
 * broker, socket server and forwarder, plus the command the UI calls with
 * the user's answer.
 */
class UiBridge {
public:
    UiBridge(BrokerConfig config, EventBus& bus);
    ~UiBridge();

    UiBridge(const UiBridge&) = delete;
    UiBridge& operator=(const UiBridge&) = delete;

    bool start();
    void stop();

    /**
     * Hands answer to the connection waiting on request_id. Throws
     * NotInitializedError before start(), otherwise whatever
     * BrokerState::resolve throws.
     */
    void send_ipc_response(const std::string& request_id, const std::string& response);

    std::shared_ptr<ipc::BrokerState> state() const;

private:
    BrokerConfig config_;
    EventBus& bus_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<ipc::BrokerState> state_;

    std::unique_ptr<ipc::IpcServer> server_;
    std::unique_ptr<RequestForwarder> forwarder_;
};

} // namespace hengjing::ui
