#include "errors.hpp"

namespace hengjing {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection:
            return "connection";
        case ErrorKind::Protocol:
            return "protocol";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::ConnectionClosed:
            return "connection_closed";
        case ErrorKind::Cancellation:
            return "cancellation";
        case ErrorKind::Mismatch:
            return "mismatch";
        case ErrorKind::NothingPending:
            return "nothing_pending";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Process:
            return "process";
        case ErrorKind::Io:
            return "io";
        case ErrorKind::Unsupported:
            return "unsupported";
        case ErrorKind::NotInitialized:
            return "not_initialized";
    }
    return "unknown";
}

} // namespace hengjing
