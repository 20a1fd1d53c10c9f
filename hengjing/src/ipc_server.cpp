#include "ipc_server.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace hengjing::ipc {

const char* const kResponseChannelClosed = "response channel closed";

namespace {

constexpr int kListenBacklog = 16;
constexpr int kPollIntervalMs = 200;
constexpr int kMaxEvents = 8;

} // namespace

IpcServer::IpcServer(std::string socket_path,
                     std::shared_ptr<BrokerState> state,
                     std::shared_ptr<const LocalTransport> transport)
    : socket_path_(std::move(socket_path)),
      state_(std::move(state)),
      transport_(transport ? std::move(transport) : make_local_transport()) {}

IpcServer::~IpcServer() {
    stop();
}

bool IpcServer::setup_socket() {
    try {
        server_fd_ = transport_->listen(socket_path_, kListenBacklog);
    } catch (const Error& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Cannot listen on " << socket_path_ << ": " << exc.what());
        server_fd_ = -1;
        return false;
    }
    return true;
}

bool IpcServer::start() {
    if (running_) {
        return true;
    }

    if (!state_) {
        LOG4CPLUS_ERROR(server_logger(), "IPC server has no broker state");
        return false;
    }

    if (!setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(server_logger(), "epoll_create1 failed: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        transport_->remove_endpoint(socket_path_);
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(server_logger(), "epoll_ctl ADD server_fd failed: " << std::strerror(errno));
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        ::close(server_fd_);
        server_fd_ = -1;
        transport_->remove_endpoint(socket_path_);
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&IpcServer::accept_loop, this);

    LOG4CPLUS_INFO(server_logger(), "IPC server listening on " << socket_path_);
    return true;
}

void IpcServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    // The accept loop notices running_ within one poll interval
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    // Wake handlers parked on the resolver, then those still reading a request
    state_->shutdown();
    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        for (int fd : client_fds_) {
            ::shutdown(fd, SHUT_RD);
        }
    }

    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks.swap(connection_tasks_);
    }
    for (auto& task : tasks) {
        task.wait();
    }

    transport_->remove_endpoint(socket_path_);
    LOG4CPLUS_INFO(server_logger(), "IPC server stopped");
}

size_t IpcServer::active_connections() const {
    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    return client_fds_.size();
}

void IpcServer::accept_loop() {
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, kPollIntervalMs);
        if (nfds < 0) {
            if (errno != EINTR && running_) {
                LOG4CPLUS_ERROR(server_logger(), "epoll_wait failed: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            if (events[i].data.fd == server_fd_) {
                accept_pending();
            }
        }

        reap_finished_connections();
    }
}

void IpcServer::accept_pending() {
    while (running_) {
        int client_fd = transport_->accept(server_fd_);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG4CPLUS_ERROR(server_logger(), "accept failed: " << std::strerror(errno));
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(client_fds_mutex_);
            client_fds_.insert(client_fd);
        }

        try {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            connection_tasks_.push_back(
                std::async(std::launch::async, &IpcServer::handle_connection, this, client_fd));
        } catch (const std::system_error& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Cannot start connection handler: " << exc.what());
            release_client(client_fd);
        }
    }
}

void IpcServer::reap_finished_connections() {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = connection_tasks_.begin();
    while (it != connection_tasks_.end()) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = connection_tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void IpcServer::release_client(int client_fd) {
    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    client_fds_.erase(client_fd);
    ::close(client_fd);
}

void IpcServer::handle_connection(int client_fd) {
    std::string line;
    ReadStatus status = ReadStatus::Closed;
    try {
        status = read_line(client_fd, line, std::nullopt);
    } catch (const Error& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Failed to read IPC request: " << exc.what());
        release_client(client_fd);
        return;
    }

    if (status == ReadStatus::Closed && line.empty()) {
        release_client(client_fd);
        return;
    }

    Request request;
    try {
        request = codec::decode_request(line);
    } catch (const ProtocolError& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Dropping IPC connection: " << exc.what());
        release_client(client_fd);
        return;
    }

    LOG4CPLUS_INFO(server_logger(), "Received IPC request: " << request.id);

    std::promise<std::string> resolver;
    std::future<std::string> answer = resolver.get_future();
    state_->set_pending(request, std::move(resolver));

    if (!state_->notify_channel()->send(request)) {
        LOG4CPLUS_WARN(server_logger(), "Notify channel closed, request " << request.id << " not forwarded");
    }

    Response response;
    try {
        response = Response::answered(request.id, answer.get());
    } catch (const std::future_error&) {
        LOG4CPLUS_WARN(server_logger(), "Request " << request.id << " cancelled before it was answered");
        response = Response::failed(request.id, kResponseChannelClosed);
    }

    try {
        write_line(client_fd, codec::encode_response(response));
    } catch (const Error& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Failed to write response for " << request.id << ": " << exc.what());
    }

    release_client(client_fd);
}

} // namespace hengjing::ipc
