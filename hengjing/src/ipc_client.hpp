#pragma once

#include "protocol.hpp"
#include "transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace hengjing::ipc {

/**
 * Backend side of the socket: detects a running front-end and exchanges
 * one request/response pair with it per call.
 */
class IpcClient {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{600};

    explicit IpcClient(std::string socket_path,
                       std::chrono::milliseconds timeout = kDefaultTimeout,
                       std::shared_ptr<const LocalTransport> transport = make_local_transport());
    virtual ~IpcClient() = default;

    Reachability probe() const;

    /**
     * True only if the socket artifact exists and accepts a connection.
     * Throws UnsupportedError where the platform cannot tell.
     */
    virtual bool is_reachable() const;

    /**
     * Sends request on a fresh connection and returns the answer text.
     * Throws ConnectionError, TimeoutError, ConnectionClosedError,
     * ProtocolError, or CancellationError when the front-end answered with
     * a failure response.
     */
    virtual std::string send_request(const Request& request) const;

    const std::string& socket_path() const { return socket_path_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string socket_path_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<const LocalTransport> transport_;
};

} // namespace hengjing::ipc
