/*
 * AdaTP - protocol error taxonomy
 */

#pragma once

#include <stdexcept>
#include <string>

namespace adatp {

enum class ErrorKind {
    MalformedFrame,        // connection-fatal
    HandshakeFailure,      // connection-fatal
    AuthFailure,           // drops the packet; fatal past the anomaly threshold
    RoutingMiss,           // counted
    TransferSizeMismatch,  // aborts the transfer
    TransferOutOfRange,    // rejects the chunk
    BackpressureDrop       // counted
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedFrame:
            return "MalformedFrame";
        case ErrorKind::HandshakeFailure:
            return "HandshakeFailure";
        case ErrorKind::AuthFailure:
            return "AuthFailure";
        case ErrorKind::RoutingMiss:
            return "RoutingMiss";
        case ErrorKind::TransferSizeMismatch:
            return "TransferSizeMismatch";
        case ErrorKind::TransferOutOfRange:
            return "TransferOutOfRange";
        case ErrorKind::BackpressureDrop:
            return "BackpressureDrop";
    }
    return "Unknown";
}

// Raised inside a connection's reader for errors that end the connection.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace adatp
