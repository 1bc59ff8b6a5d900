#include "bkc/core/error.hpp"

namespace bkc {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection: return "connection error";
        case ErrorKind::Io: return "i/o error";
        case ErrorKind::MalformedMessage: return "malformed message";
        case ErrorKind::VersionMismatch: return "version mismatch";
        case ErrorKind::FileAccess: return "file access error";
        case ErrorKind::ServerStatus: return "server error";
        case ErrorKind::InvalidArgument: return "invalid argument";
    }
    return "unknown error";
}

bool is_fatal(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:
        case ErrorKind::Io:
        case ErrorKind::MalformedMessage:
        case ErrorKind::VersionMismatch:
            return true;
        case ErrorKind::FileAccess:
        case ErrorKind::ServerStatus:
        case ErrorKind::InvalidArgument:
            return false;
    }
    return true;
}

std::string Error::describe() const {
    return std::string(to_string(kind)) + ": " + message;
}

} // namespace bkc
