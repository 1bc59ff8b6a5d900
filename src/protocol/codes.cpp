#include "bkc/protocol/codes.hpp"

namespace bkc::protocol {

std::optional<RequestCode> request_code_from_wire(std::uint8_t value) noexcept {
    const auto code = static_cast<RequestCode>(value);
    switch (code) {
        case RequestCode::Backup:
        case RequestCode::Restore:
        case RequestCode::Delete:
        case RequestCode::List:
            return code;
    }
    return std::nullopt;
}

std::optional<StatusCode> status_code_from_wire(std::uint16_t value) noexcept {
    const auto code = static_cast<StatusCode>(value);
    switch (code) {
        case StatusCode::SuccessFound:
        case StatusCode::SuccessFileList:
        case StatusCode::SuccessNoPayload:
        case StatusCode::FileNotFound:
        case StatusCode::NoFiles:
        case StatusCode::ServerError:
        case StatusCode::VersionMismatch:
            return code;
    }
    return std::nullopt;
}

const char* to_string(RequestCode code) noexcept {
    switch (code) {
        case RequestCode::Backup: return "BACKUP";
        case RequestCode::Restore: return "RESTORE";
        case RequestCode::Delete: return "DELETE";
        case RequestCode::List: return "LIST";
    }
    return "UNKNOWN";
}

const char* to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::SuccessFound: return "SUCCESS_FOUND";
        case StatusCode::SuccessFileList: return "SUCCESS_FILE_LIST";
        case StatusCode::SuccessNoPayload: return "SUCCESS_NO_PAYLOAD";
        case StatusCode::FileNotFound: return "FILE_NOT_FOUND";
        case StatusCode::NoFiles: return "NO_FILES";
        case StatusCode::ServerError: return "SERVER_ERROR";
        case StatusCode::VersionMismatch: return "VERSION_MISMATCH";
    }
    return "UNKNOWN";
}

bool carries_payload(StatusCode status) noexcept {
    return status == StatusCode::SuccessFound || status == StatusCode::SuccessFileList;
}

bool is_success(StatusCode status) noexcept {
    switch (status) {
        case StatusCode::SuccessFound:
        case StatusCode::SuccessFileList:
        case StatusCode::SuccessNoPayload:
            return true;
        case StatusCode::FileNotFound:
        case StatusCode::NoFiles:
        case StatusCode::ServerError:
        case StatusCode::VersionMismatch:
            return false;
    }
    return false;
}

bool answers(RequestCode request, StatusCode status) noexcept {
    if (!is_success(status)) {
        return true;
    }
    switch (request) {
        case RequestCode::Backup:
        case RequestCode::Delete:
            return status == StatusCode::SuccessNoPayload;
        case RequestCode::Restore:
            return status == StatusCode::SuccessFound;
        case RequestCode::List:
            return status == StatusCode::SuccessFileList;
    }
    return false;
}

} // namespace bkc::protocol
