#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace hengjing::ipc {

/// Largest request or response line either side accepts
constexpr size_t kMaxLineLength = 16 * 1024 * 1024;

enum class Reachability {
    Running,     // artifact exists and accepted a connection
    NotRunning,  // definitely nobody listening
    Unsupported, // this platform cannot tell
};

const char* to_string(Reachability reachability);

/// Owns a file descriptor and closes it on destruction
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

/**
 * Filesystem-addressed local stream transport. One implementation exists per
 * platform capability; all of them speak in raw descriptors.
 */
class LocalTransport {
public:
    virtual ~LocalTransport() = default;

    virtual const char* name() const = 0;

    /// Never throws; Unsupported when the platform has no local sockets
    virtual Reachability probe(const std::string& endpoint) const = 0;

    /// Connected descriptor; throws ConnectionError or UnsupportedError
    virtual int connect(const std::string& endpoint) const = 0;

    /// Listening descriptor (non-blocking); removes a stale artifact first
    virtual int listen(const std::string& endpoint, int backlog) const = 0;

    /// Accepted descriptor, or -1 with errno set
    virtual int accept(int listen_fd) const = 0;

    virtual void remove_endpoint(const std::string& endpoint) const = 0;
};

class UnixSocketTransport final : public LocalTransport {
public:
    const char* name() const override { return "unix"; }
    Reachability probe(const std::string& endpoint) const override;
    int connect(const std::string& endpoint) const override;
    int listen(const std::string& endpoint, int backlog) const override;
    int accept(int listen_fd) const override;
    void remove_endpoint(const std::string& endpoint) const override;
};

/**
 * Stand-in for a platform without local stream sockets. Never picked by
 * make_local_transport(); callers that need the "cannot check" behaviour
 * pass it in explicitly.
 */
class UnsupportedTransport final : public LocalTransport {
public:
    const char* name() const override { return "unsupported"; }
    Reachability probe(const std::string& endpoint) const override;
    int connect(const std::string& endpoint) const override;
    int listen(const std::string& endpoint, int backlog) const override;
    int accept(int listen_fd) const override;
    void remove_endpoint(const std::string& endpoint) const override;
};

/// Unix domain sockets; the build targets Linux only (epoll, accept4, pipe2)
std::shared_ptr<const LocalTransport> make_local_transport();

enum class ReadStatus {
    Line,    // a full newline-terminated line was read
    Closed,  // peer closed first; line holds whatever arrived
    Timeout,
};

/// Writes text plus '\n'; throws ConnectionError if the peer went away
void write_line(int fd, const std::string& text);

/**
 * Reads one line (without the '\n'). No timeout means wait forever.
 * Throws ConnectionError on read failure and ProtocolError past max_length.
 */
ReadStatus read_line(int fd,
                     std::string& line,
                     std::optional<std::chrono::milliseconds> timeout,
                     size_t max_length = kMaxLineLength);

} // namespace hengjing::ipc
