#pragma once

#include "ipc_client.hpp"
#include "popup_launcher.hpp"
#include "protocol.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace hengjing::popup {

enum class PopupRoute {
    None,
    Ipc,
    Fallback,
};

/**
 * Public entry point for asking the user a question.
 *
 * A running front-end is tried first over the socket. Any failure on that
 * path is logged and replaced by launching a new front-end, whose outcome
 * (answer or error) is final.
 *
 * Safe to call from several threads. Each fallback gets its own lane thread
 * (up to kMaxBlockingLanes), so one unanswered popup never delays another.
 */
class PopupOrchestrator {
public:
    static constexpr size_t kMaxBlockingLanes = 16;

    PopupOrchestrator(std::shared_ptr<const ipc::IpcClient> client, std::shared_ptr<const PopupLauncher> launcher);
    ~PopupOrchestrator();

    PopupOrchestrator(const PopupOrchestrator&) = delete;
    PopupOrchestrator& operator=(const PopupOrchestrator&) = delete;

    std::string resolve_popup(const ipc::Request& request);

    /// Route taken by the most recently routed resolve_popup call
    PopupRoute last_route() const { return last_route_.load(); }

private:
    std::shared_ptr<const ipc::IpcClient> client_;
    std::shared_ptr<const PopupLauncher> launcher_;
    WorkerPool blocking_lanes_{1, kMaxBlockingLanes};
    std::atomic<PopupRoute> last_route_{PopupRoute::None};
};

std::unique_ptr<PopupOrchestrator> make_orchestrator(const BrokerConfig& config);

} // namespace hengjing::popup
