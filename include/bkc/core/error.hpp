#pragma once

#include <string>

namespace bkc {

/**
 * @brief Failure categories surfaced by the client library
 *
 * Connection, Io, MalformedMessage and VersionMismatch abort the whole
 * operation. FileAccess and ServerStatus only affect the file they occur on.
 */
enum class ErrorKind {
    Connection,       ///< Endpoint unreachable, refused, or connect timed out
    Io,               ///< Short send/receive, peer closed, I/O timeout
    MalformedMessage, ///< Bytes violate the wire format
    VersionMismatch,  ///< Server speaks another protocol version
    FileAccess,       ///< Local file could not be read or written
    ServerStatus,     ///< Server answered with a non-success status
    InvalidArgument   ///< Caller or configuration supplied unusable input
};

struct Error {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] std::string describe() const;
};

const char* to_string(ErrorKind kind) noexcept;

[[nodiscard]] bool is_fatal(ErrorKind kind) noexcept;

inline bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.kind == rhs.kind && lhs.message == rhs.message;
}

} // namespace bkc
