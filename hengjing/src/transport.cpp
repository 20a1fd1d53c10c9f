#include "transport.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace hengjing::ipc {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

bool fill_address(const std::string& endpoint, sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (endpoint.empty() || endpoint.size() >= sizeof(addr.sun_path)) {
        return false;
    }
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);
    return true;
}

} // namespace

const char* to_string(Reachability reachability) {
    switch (reachability) {
        case Reachability::Running:
            return "running";
        case Reachability::NotRunning:
            return "not running";
        case Reachability::Unsupported:
            return "unsupported";
    }
    return "unknown";
}

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

Reachability UnixSocketTransport::probe(const std::string& endpoint) const {
    std::error_code ec;
    if (!std::filesystem::exists(endpoint, ec)) {
        return Reachability::NotRunning;
    }

    sockaddr_un addr{};
    if (!fill_address(endpoint, addr)) {
        return Reachability::NotRunning;
    }

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        return Reachability::NotRunning;
    }
    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_DEBUG(client_logger(), "Probe of " << endpoint << " failed: " << errno_text(errno));
        return Reachability::NotRunning;
    }
    return Reachability::Running;
}

int UnixSocketTransport::connect(const std::string& endpoint) const {
    sockaddr_un addr{};
    if (!fill_address(endpoint, addr)) {
        throw ConnectionError("Invalid socket path: " + endpoint);
    }

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        throw ConnectionError("socket() failed: " + errno_text(errno));
    }

    int rc = 0;
    do {
        rc = ::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        throw ConnectionError("Cannot connect to UI process at " + endpoint + ": " + errno_text(errno));
    }
    return fd.release();
}

int UnixSocketTransport::listen(const std::string& endpoint, int backlog) const {
    sockaddr_un addr{};
    if (!fill_address(endpoint, addr)) {
        throw IoError("Invalid socket path: " + endpoint);
    }

    std::error_code ec;
    if (std::filesystem::exists(endpoint, ec)) {
        LOG4CPLUS_INFO(server_logger(), "Removing stale socket " << endpoint);
        if (!std::filesystem::remove(endpoint, ec) && ec) {
            throw IoError("Cannot remove stale socket " + endpoint + ": " + ec.message());
        }
    }

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
    if (!fd.valid()) {
        throw IoError("socket() failed: " + errno_text(errno));
    }

    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw IoError("bind() failed for " + endpoint + ": " + errno_text(errno));
    }

    if (::chmod(endpoint.c_str(), 0600) < 0) {
        LOG4CPLUS_WARN(server_logger(), "Cannot restrict permissions on " << endpoint << ": " << errno_text(errno));
    }

    if (::listen(fd.get(), backlog) < 0) {
        int err = errno;
        ::unlink(endpoint.c_str());
        throw IoError("listen() failed for " + endpoint + ": " + errno_text(err));
    }

    return fd.release();
}

int UnixSocketTransport::accept(int listen_fd) const {
    return ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
}

void UnixSocketTransport::remove_endpoint(const std::string& endpoint) const {
    ::unlink(endpoint.c_str());
}

Reachability UnsupportedTransport::probe(const std::string&) const {
    return Reachability::Unsupported;
}

int UnsupportedTransport::connect(const std::string&) const {
    throw UnsupportedError("Local socket IPC is not implemented on this platform");
}

int UnsupportedTransport::listen(const std::string&, int) const {
    throw UnsupportedError("Local socket IPC is not implemented on this platform");
}

int UnsupportedTransport::accept(int) const {
    errno = ENOTSUP;
    return -1;
}

void UnsupportedTransport::remove_endpoint(const std::string&) const {}

std::shared_ptr<const LocalTransport> make_local_transport() {
    return std::make_shared<UnixSocketTransport>();
}

void write_line(int fd, const std::string& text) {
    std::string frame = text;
    frame.push_back('\n');

    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{fd, POLLOUT, 0};
                ::poll(&pfd, 1, 1000);
                continue;
            }
            throw ConnectionError("write failed: " + errno_text(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

ReadStatus read_line(int fd,
                     std::string& line,
                     std::optional<std::chrono::milliseconds> timeout,
                     size_t max_length) {
    using clock = std::chrono::steady_clock;
    const auto deadline = timeout ? clock::now() + *timeout : clock::time_point::max();

    line.clear();
    char buf[4096];

    while (true) {
        int wait_ms = -1;
        if (timeout) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() <= 0) {
                return ReadStatus::Timeout;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 60 * 60 * 1000));
        }

        pollfd pfd{fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ConnectionError("poll failed: " + errno_text(errno));
        }
        if (ret == 0) {
            // Either the deadline passed or a long slice elapsed; re-check above
            continue;
        }

        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            throw ConnectionError("read failed: " + errno_text(errno));
        }
        if (n == 0) {
            return ReadStatus::Closed;
        }

        line.append(buf, static_cast<size_t>(n));
        size_t pos = line.find('\n');
        if (pos != std::string::npos) {
            line.resize(pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }
        if (line.size() > max_length) {
            throw ProtocolError("Line exceeds " + std::to_string(max_length) + " bytes");
        }
    }
}

} // namespace hengjing::ipc
