#pragma once

#include <stdexcept>
#include <string>

namespace hengjing {

enum class ErrorKind {
    Connection,
    Protocol,
    Timeout,
    ConnectionClosed,
    Cancellation,
    Mismatch,
    NothingPending,
    Configuration,
    Process,
    Io,
    Unsupported,
    NotInitialized,
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

template <ErrorKind K>
class KindError : public Error {
public:
    explicit KindError(const std::string& message) : Error(K, message) {}
};

using ConnectionError = KindError<ErrorKind::Connection>;
using ProtocolError = KindError<ErrorKind::Protocol>;
using TimeoutError = KindError<ErrorKind::Timeout>;
using ConnectionClosedError = KindError<ErrorKind::ConnectionClosed>;
using CancellationError = KindError<ErrorKind::Cancellation>;
using MismatchError = KindError<ErrorKind::Mismatch>;
using NothingPendingError = KindError<ErrorKind::NothingPending>;
using ConfigurationError = KindError<ErrorKind::Configuration>;
using ProcessError = KindError<ErrorKind::Process>;
using IoError = KindError<ErrorKind::Io>;
using UnsupportedError = KindError<ErrorKind::Unsupported>;
using NotInitializedError = KindError<ErrorKind::NotInitialized>;

} // namespace hengjing
