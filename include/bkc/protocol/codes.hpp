#pragma once

#include <cstdint>
#include <optional>

namespace bkc::protocol {

constexpr std::uint8_t kProtocolVersion = 1;

enum class RequestCode : std::uint8_t {
    Backup = 100,
    Restore = 200,
    Delete = 201,
    List = 202
};

/**
 * @brief Response statuses understood by protocol version 1
 *
 * Only SuccessFound and SuccessFileList carry a size field and payload.
 */
enum class StatusCode : std::uint16_t {
    SuccessFound = 210,     ///< restore: file content follows
    SuccessFileList = 211,  ///< list: listing follows
    SuccessNoPayload = 212, ///< backup/delete acknowledged
    FileNotFound = 1001,
    NoFiles = 1002,         ///< list: the user owns no files
    ServerError = 1003,
    VersionMismatch = 1004
};

/// Maps a wire byte to a request code; nullopt for anything outside the set.
std::optional<RequestCode> request_code_from_wire(std::uint8_t value) noexcept;

std::optional<StatusCode> status_code_from_wire(std::uint16_t value) noexcept;

const char* to_string(RequestCode code) noexcept;
const char* to_string(StatusCode code) noexcept;

[[nodiscard]] bool carries_payload(StatusCode status) noexcept;

[[nodiscard]] bool is_success(StatusCode status) noexcept;

/// True when `status` is a success answer the server may give to `request`.
[[nodiscard]] bool answers(RequestCode request, StatusCode status) noexcept;

} // namespace bkc::protocol
