#include "ipc_client.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace hengjing::ipc {

IpcClient::IpcClient(std::string socket_path,
                     std::chrono::milliseconds timeout,
                     std::shared_ptr<const LocalTransport> transport)
    : socket_path_(std::move(socket_path)),
      timeout_(timeout),
      transport_(transport ? std::move(transport) : make_local_transport()) {}

Reachability IpcClient::probe() const {
    return transport_->probe(socket_path_);
}

bool IpcClient::is_reachable() const {
    Reachability reachability = probe();
    if (reachability == Reachability::Unsupported) {
        throw UnsupportedError(std::string("Cannot check for a running UI with the ") + transport_->name() +
                               " transport");
    }
    return reachability == Reachability::Running;
}

std::string IpcClient::send_request(const Request& request) const {
    UniqueFd fd(transport_->connect(socket_path_));

    write_line(fd.get(), codec::encode_request(request));
    LOG4CPLUS_DEBUG(client_logger(), "Sent IPC request " << request.id << " to " << socket_path_);

    std::string line;
    ReadStatus status = read_line(fd.get(), line, timeout_);
    if (status == ReadStatus::Timeout) {
        throw TimeoutError("Timed out after " + std::to_string(timeout_.count()) + " ms waiting for a response");
    }
    if (status == ReadStatus::Closed && line.empty()) {
        throw ConnectionClosedError("Connection closed before a response arrived");
    }

    Response response = codec::decode_response(line);
    if (!response.success) {
        throw CancellationError(response.error ? *response.error : std::string("unknown error"));
    }

    LOG4CPLUS_INFO(client_logger(), "IPC response received for " << request.id);
    return response.response;
}

} // namespace hengjing::ipc
