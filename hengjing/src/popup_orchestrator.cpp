#include "popup_orchestrator.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hengjing::popup {

PopupOrchestrator::PopupOrchestrator(std::shared_ptr<const ipc::IpcClient> client,
                                     std::shared_ptr<const PopupLauncher> launcher)
    : client_(std::move(client)), launcher_(std::move(launcher)) {}

PopupOrchestrator::~PopupOrchestrator() {
    blocking_lanes_.stop();
}

std::string PopupOrchestrator::resolve_popup(const ipc::Request& request) {
    bool ui_running = false;
    try {
        ui_running = client_->is_reachable();
    } catch (const Error& exc) {
        LOG4CPLUS_WARN(core_logger(), "Cannot check for a running UI: " << exc.what());
    }

    if (ui_running) {
        LOG4CPLUS_INFO(core_logger(), "UI is running, sending request " << request.id << " over IPC");
        try {
            std::string response = client_->send_request(request);
            last_route_ = PopupRoute::Ipc;
            LOG4CPLUS_INFO(core_logger(), "IPC response received for " << request.id);
            return response;
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(core_logger(), "IPC request failed: " << exc.what() << ", falling back to a new UI process");
        }
    }

    LOG4CPLUS_INFO(core_logger(), "Starting a new UI process for request " << request.id);
    last_route_ = PopupRoute::Fallback;
    auto launcher = launcher_;
    return blocking_lanes_.submit([launcher, request] { return launcher->launch(request); }).get();
}

std::unique_ptr<PopupOrchestrator> make_orchestrator(const BrokerConfig& config) {
    auto client = std::make_shared<ipc::IpcClient>(config.socket_path,
                                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                                       config.request_timeout));
    auto launcher = std::make_shared<PopupLauncher>(LauncherOptions::from_config(config));
    return std::make_unique<PopupOrchestrator>(std::move(client), std::move(launcher));
}

} // namespace hengjing::popup
