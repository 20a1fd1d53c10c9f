#pragma once

#include "broker_state.hpp"
#include "transport.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace hengjing::ipc {

/// Error text sent back when the pending resolver is dropped unanswered
extern const char* const kResponseChannelClosed;

/**
 * Local socket server embedded in the front-end process.
 *
 * Every connection carries exactly one request line and receives exactly
 * one response line. The handler parks the request in the broker, forwards
 * it on the notify channel and waits, without a timeout, for the UI to
 * resolve it.
 */
class IpcServer {
public:
    IpcServer(std::string socket_path,
              std::shared_ptr<BrokerState> state,
              std::shared_ptr<const LocalTransport> transport = make_local_transport());
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    /// Bind and start accepting in the background
    bool start();

    /// Stop accepting, cancel the waiting request and join every connection
    void stop();

    bool is_running() const { return running_.load(); }

    const std::string& socket_path() const { return socket_path_; }

    std::shared_ptr<BrokerState> state() const { return state_; }

    size_t active_connections() const;

private:
    std::string socket_path_;
    std::shared_ptr<BrokerState> state_;
    std::shared_ptr<const LocalTransport> transport_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    std::vector<std::future<void>> connection_tasks_;
    std::mutex tasks_mutex_;

    std::unordered_set<int> client_fds_;
    mutable std::mutex client_fds_mutex_;

    bool setup_socket();
    void accept_loop();
    void accept_pending();
    void reap_finished_connections();
    void handle_connection(int client_fd);
    void release_client(int client_fd);
};

} // namespace hengjing::ipc
