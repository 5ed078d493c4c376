#pragma once

#include <string>

namespace sendme {

/**
 * @brief Failure categories reported by every sendme operation
 *
 * The first six kinds are the ones the collection/transfer logic reasons
 * about; the remaining ones come from the store, the transport and the CLI.
 */
enum class ErrorKind {
    InvalidPath,       ///< Untrusted name failed sanitization
    NotFound,          ///< Import root, blob or collection is absent
    AssemblyFailed,    ///< Collection build aborted, nothing persisted
    ExportFailed,      ///< A single entry could not be written to disk
    TransferAborted,   ///< The transfer stream reported an abort
    ProtocolViolation, ///< Out-of-order or post-terminal transfer event
    Io,
    InvalidArgument,
    Corrupt,           ///< Malformed stored/received data or hash mismatch
    Network
};

struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "invalid path";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::AssemblyFailed: return "assembly failed";
        case ErrorKind::ExportFailed: return "export failed";
        case ErrorKind::TransferAborted: return "transfer aborted";
        case ErrorKind::ProtocolViolation: return "protocol violation";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::Corrupt: return "corrupt data";
        case ErrorKind::Network: return "network error";
    }
    return "unknown";
}

} // namespace sendme
