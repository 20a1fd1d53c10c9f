#include "ui_bridge.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hengjing::ui {

RequestForwarder::RequestForwarder(std::shared_ptr<ipc::RequestChannel> channel,
                                   EventBus& bus,
                                   std::vector<std::string> event_channels)
    : channel_(std::move(channel)), bus_(bus), event_channels_(std::move(event_channels)) {}

RequestForwarder::~RequestForwarder() {
    if (channel_) {
        channel_->close();
    }
    join();
}

void RequestForwarder::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&RequestForwarder::run, this);
}

void RequestForwarder::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void RequestForwarder::run() {
    while (auto request = channel_->receive()) {
        LOG4CPLUS_INFO(ui_logger(), "Forwarding IPC request to the UI: " << request->id);

        nlohmann::ordered_json payload = ipc::codec::request_to_json(*request);
        for (const auto& event_channel : event_channels_) {
            if (bus_.emit(event_channel, payload) == 0) {
                LOG4CPLUS_DEBUG(ui_logger(), "No listener on " << event_channel);
            }
        }
        ++forwarded_;
    }
}

UiBridge::UiBridge(BrokerConfig config, EventBus& bus)
    : config_(std::move(config)), bus_(bus) {}

UiBridge::~UiBridge() {
    stop();
}

bool UiBridge::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_) {
        return true;
    }

    auto channel = std::make_shared<ipc::RequestChannel>(config_.notify_capacity);
    auto state = std::make_shared<ipc::BrokerState>(channel);
    auto server = std::make_unique<ipc::IpcServer>(config_.socket_path, state);
    if (!server->start()) {
        LOG4CPLUS_ERROR(ui_logger(), "Failed to start IPC server");
        return false;
    }

    forwarder_ = std::make_unique<RequestForwarder>(channel, bus_, config_.notification_channels);
    forwarder_->start();
    server_ = std::move(server);
    state_ = std::move(state);
    return true;
}

void UiBridge::stop() {
    std::unique_ptr<ipc::IpcServer> server;
    std::unique_ptr<RequestForwarder> forwarder;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server = std::move(server_);
        forwarder = std::move(forwarder_);
        state_.reset();
    }
    if (server) {
        server->stop();
    }
    if (forwarder) {
        forwarder->join();
    }
}

void UiBridge::send_ipc_response(const std::string& request_id, const std::string& response) {
    std::shared_ptr<ipc::BrokerState> state = this->state();
    if (!state) {
        throw NotInitializedError("IPC server is not initialized");
    }
    state->resolve(request_id, response);
}

std::shared_ptr<ipc::BrokerState> UiBridge::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

} // namespace hengjing::ui
